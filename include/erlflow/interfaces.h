#pragma once

#include <erlflow/deadline.h>
#include <erlflow/flow_graph.h>
#include <erlflow/models.h>
#include <erlflow/syntax_tree.h>

#include <string>

namespace erlflow {

class SourceLocator {
public:
  virtual ~SourceLocator() = default;
  virtual SourceDiscoveryResult Locate(const CorpusConfig &config) = 0;
};

class SyntaxParser {
public:
  virtual ~SyntaxParser() = default;
  virtual SyntaxTree Parse(const SourceFile &file,
                           const Deadline &deadline) const = 0;
};

struct GroupingResult {
  std::vector<ClauseGroup> groups;
  std::vector<NonContiguousClauseError> rejected;
};

class ClauseGrouper {
public:
  virtual ~ClauseGrouper() = default;
  virtual GroupingResult Group(const SyntaxTree &tree) const = 0;
};

class FlowAnalyzer {
public:
  virtual ~FlowAnalyzer() = default;
  virtual FlowGraph Analyze(const ClauseGroup &group,
                            const FlowOptions &options,
                            const Deadline &deadline) const = 0;
};

class DocumentationProvider {
public:
  virtual ~DocumentationProvider() = default;
  // Empty string when the group has no documentation.
  virtual std::string Lookup(const SyntaxTree &tree,
                             const ClauseGroup &group) const = 0;
};

class RecordAssembler {
public:
  virtual ~RecordAssembler() = default;
  virtual TrainingRecord Assemble(const SourceFile &file,
                                  const SyntaxTree &tree,
                                  const ClauseGroup &group,
                                  const FlowGraph &graph,
                                  std::string docstring,
                                  const CorpusConfig &config) const = 0;
};

class RecordSink {
public:
  virtual ~RecordSink() = default;
  virtual void Write(const TrainingRecord &record) = 0;
  virtual void Flush() = 0;
};

class CorpusPipeline {
public:
  virtual ~CorpusPipeline() = default;
  virtual RunSummary Run(const CorpusConfig &config) = 0;
};

} // namespace erlflow
