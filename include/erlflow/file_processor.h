#pragma once

#include <erlflow/interfaces.h>
#include <erlflow/logging.h>

#include <memory>

namespace erlflow {

// Runs one file end to end: read, parse, group, analyze and assemble.
// Never throws; every failure is recorded on the returned outcome. A failed
// file carries no records.
class FileProcessor {
public:
  FileProcessor(const SyntaxParser &parser, const ClauseGrouper &grouper,
                const FlowAnalyzer &analyzer,
                const DocumentationProvider &documentation,
                const RecordAssembler &assembler,
                std::shared_ptr<Logger> logger);

  FileOutcome Process(const SourceCandidate &candidate,
                      const CorpusConfig &config) const;

private:
  void ProcessGroup(const SourceFile &file, const SyntaxTree &tree,
                    const ClauseGroup &group, const CorpusConfig &config,
                    const Deadline &deadline, FileOutcome &outcome) const;
  void RecordIssue(FileOutcome &outcome, ErrorKind kind, LogLevel level,
                   std::string_view event, std::string location,
                   std::string message) const;

  const SyntaxParser &parser_;
  const ClauseGrouper &grouper_;
  const FlowAnalyzer &analyzer_;
  const DocumentationProvider &documentation_;
  const RecordAssembler &assembler_;
  std::shared_ptr<Logger> logger_;
};

SourceFile ReadSourceFile(const SourceCandidate &candidate);

} // namespace erlflow
