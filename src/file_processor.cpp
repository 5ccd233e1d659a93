#include <erlflow/file_processor.h>

#include <erlflow/graph_code_record_assembler.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <utility>

namespace erlflow {
namespace {

std::string TokenLocation(const std::string &path, const SyntaxTree &tree,
                          std::size_t token) {
  if (token >= tree.tokens.size()) {
    return path;
  }
  return path + ":" + std::to_string(tree.tokens[token].line) + ":" +
         std::to_string(tree.tokens[token].column);
}

// Occurrence counts per role and edge counts per kind, e.g. "edges.message".
LogFields GraphFields(const std::string &group_id, const FlowGraph &graph) {
  std::map<std::string, std::size_t> counts;
  for (const auto &occurrence : graph.occurrences) {
    ++counts["roles." + OccurrenceRoleName(occurrence.role)];
  }
  for (const auto &edge : graph.edges) {
    ++counts["edges." + EdgeKindName(edge.kind)];
  }
  LogFields fields{{"group", group_id},
                   {"occurrences", std::to_string(graph.occurrences.size())},
                   {"edges", std::to_string(graph.edges.size())}};
  for (const auto &count : counts) {
    fields.emplace_back(count.first, std::to_string(count.second));
  }
  return fields;
}

} // namespace

SourceFile ReadSourceFile(const SourceCandidate &candidate) {
  std::ifstream input(candidate.path, std::ios::binary);
  if (!input) {
    throw SourceReadError(candidate.path);
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (input.bad()) {
    throw SourceReadError(candidate.path);
  }

  SourceFile file;
  file.path = candidate.path;
  file.relative_path = candidate.relative_path.empty()
                           ? candidate.path
                           : candidate.relative_path;
  file.content = buffer.str();
  file.module = std::filesystem::path(candidate.path).stem().string();
  return file;
}

FileProcessor::FileProcessor(const SyntaxParser &parser,
                             const ClauseGrouper &grouper,
                             const FlowAnalyzer &analyzer,
                             const DocumentationProvider &documentation,
                             const RecordAssembler &assembler,
                             std::shared_ptr<Logger> logger)
    : parser_(parser), grouper_(grouper), analyzer_(analyzer),
      documentation_(documentation), assembler_(assembler),
      logger_(EnsureLogger(std::move(logger))) {}

void FileProcessor::RecordIssue(FileOutcome &outcome, ErrorKind kind,
                                LogLevel level, std::string_view event,
                                std::string location,
                                std::string message) const {
  logger_->Log(level, event,
               {{"kind", ErrorKindName(kind)},
                {"location", location},
                {"message", message}});
  outcome.issues.push_back({kind, std::move(location), std::move(message)});
}

FileOutcome FileProcessor::Process(const SourceCandidate &candidate,
                                   const CorpusConfig &config) const {
  FileOutcome outcome;
  outcome.path = candidate.relative_path.empty() ? candidate.path
                                                 : candidate.relative_path;
  const Deadline deadline(config.file_timeout);

  try {
    const auto file = ReadSourceFile(candidate);
    const auto tree = parser_.Parse(file, deadline);
    const auto grouping = grouper_.Group(tree);
    for (const auto &rejected : grouping.rejected) {
      RecordIssue(outcome, rejected.Kind(), LogLevel::kWarn, "group.skipped",
                  outcome.path + ":" + std::to_string(rejected.RepeatLine()),
                  rejected.what());
    }
    for (const auto &group : grouping.groups) {
      deadline.Check("record assembly");
      ProcessGroup(file, tree, group, config, deadline, outcome);
    }
    logger_->Log(LogLevel::kDebug, "file.processed",
                 {{"path", outcome.path},
                  {"groups", std::to_string(grouping.groups.size())},
                  {"records", std::to_string(outcome.records.size())}});
  } catch (const ParseError &error) {
    outcome.failed = true;
    outcome.records.clear();
    RecordIssue(outcome, ErrorKind::kParse, LogLevel::kWarn, "file.failed",
                outcome.path + ":" + std::to_string(error.Line()) + ":" +
                    std::to_string(error.Column()),
                error.Detail());
  } catch (const CorpusError &error) {
    outcome.failed = true;
    outcome.records.clear();
    RecordIssue(outcome, error.Kind(), LogLevel::kWarn, "file.failed",
                outcome.path, error.what());
  } catch (const std::exception &error) {
    outcome.failed = true;
    outcome.records.clear();
    RecordIssue(outcome, ErrorKind::kInternal, LogLevel::kError,
                "file.failed", outcome.path, error.what());
  }
  return outcome;
}

void FileProcessor::ProcessGroup(const SourceFile &file,
                                 const SyntaxTree &tree,
                                 const ClauseGroup &group,
                                 const CorpusConfig &config,
                                 const Deadline &deadline,
                                 FileOutcome &outcome) const {
  const auto group_id = group.id.ToString();
  const auto lines = GroupLineSpan(tree, group);
  if (!group.clauses.empty() && (lines < config.min_function_lines ||
                                 lines > config.max_function_lines)) {
    ++outcome.groups_filtered;
    logger_->Log(LogLevel::kDebug, "group.filtered",
                 {{"group", group_id}, {"lines", std::to_string(lines)}});
    return;
  }

  try {
    auto graph = analyzer_.Analyze(group, config.flow, deadline);
    if (logger_->IsEnabled(LogLevel::kDebug)) {
      logger_->Log(LogLevel::kDebug, "group.analyzed",
                   GraphFields(group_id, graph));
    }
    for (auto &scope_error : graph.scope_errors) {
      if (scope_error.token_index < tree.tokens.size()) {
        const auto &token = tree.tokens[scope_error.token_index];
        scope_error.line = token.line;
        scope_error.column = token.column;
      }
      RecordIssue(outcome, ErrorKind::kScope, LogLevel::kWarn,
                  "scope.unresolved",
                  TokenLocation(outcome.path, tree, scope_error.token_index),
                  group_id + ": " + scope_error.Describe());
    }
    auto docstring = documentation_.Lookup(tree, group);
    outcome.records.push_back(assembler_.Assemble(
        file, tree, group, graph, std::move(docstring), config));
  } catch (const EmptyClauseGroupError &error) {
    RecordIssue(outcome, error.Kind(), LogLevel::kError, "group.skipped",
                outcome.path, error.what());
  } catch (const RecordValidationError &error) {
    RecordIssue(outcome, error.Kind(), LogLevel::kError, "group.skipped",
                outcome.path, error.what());
  }
}

} // namespace erlflow
