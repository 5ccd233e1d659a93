#include <erlflow/graph_code_record_assembler.h>

#include <set>
#include <utility>

namespace erlflow {
namespace {

std::string RecordPath(const SourceFile &file) {
  return file.relative_path.empty() ? file.path : file.relative_path;
}

std::string BuildUrl(const std::string &source_url, const std::string &path,
                     std::size_t first_line, std::size_t last_line) {
  std::string url;
  if (!source_url.empty()) {
    url = source_url;
    if (url.back() != '/') {
      url.push_back('/');
    }
  }
  return url + path + "#L" + std::to_string(first_line) + "-L" +
         std::to_string(last_line);
}

std::vector<TokenEdge> RemapEdges(const std::vector<FlowEdge> &edges,
                                  const FlowGraph &graph, std::size_t base,
                                  std::size_t token_count,
                                  const std::string &group_id) {
  std::vector<TokenEdge> remapped;
  std::set<TokenEdge> seen;
  const auto to_token = [&](std::size_t occurrence) {
    if (occurrence >= graph.occurrences.size()) {
      throw RecordValidationError(group_id + ": edge endpoint " +
                                  std::to_string(occurrence) +
                                  " is not a known occurrence");
    }
    const auto token = graph.occurrences[occurrence].token_index;
    if (token < base || token - base >= token_count) {
      throw RecordValidationError(
          group_id + ": edge endpoint token " + std::to_string(token) +
          " is outside the record's " + std::to_string(token_count) +
          " tokens");
    }
    return token - base;
  };

  for (const auto &edge : edges) {
    TokenEdge pair{to_token(edge.source), to_token(edge.target)};
    if (pair.first == pair.second) {
      continue;
    }
    if (seen.insert(pair).second) {
      remapped.push_back(pair);
    }
  }
  return remapped;
}

} // namespace

std::size_t GroupLineSpan(const SyntaxTree &tree, const ClauseGroup &group) {
  if (group.last_token >= tree.tokens.size() ||
      group.first_token > group.last_token) {
    return 0;
  }
  return tree.tokens[group.last_token].line -
         tree.tokens[group.first_token].line + 1;
}

TrainingRecord GraphCodeRecordAssembler::Assemble(
    const SourceFile &file, const SyntaxTree &tree, const ClauseGroup &group,
    const FlowGraph &graph, std::string docstring,
    const CorpusConfig &config) const {
  const auto group_id = group.id.ToString();
  if (group.clauses.empty()) {
    throw EmptyClauseGroupError(group_id);
  }
  const auto begin = group.first_token;
  const auto end = group.last_token;
  if (end >= tree.tokens.size() || begin > end) {
    throw RecordValidationError(group_id + ": token range [" +
                                std::to_string(begin) + ", " +
                                std::to_string(end) +
                                "] is outside the file");
  }

  TrainingRecord record;
  const auto path = RecordPath(file);
  record.idx = path + ":" + group.id.name + "/" +
               std::to_string(group.id.arity);

  const auto &first = tree.tokens[begin];
  const auto &last = tree.tokens[end];
  record.url = BuildUrl(config.source_url, path, first.line, last.line);
  record.docstring = std::move(docstring);

  const auto code_end = last.offset + last.length;
  if (code_end > file.content.size()) {
    throw RecordValidationError(group_id + ": token offsets exceed source");
  }
  record.code = file.content.substr(first.offset, code_end - first.offset);

  record.code_tokens.reserve(end - begin + 1);
  for (auto index = begin; index <= end; ++index) {
    record.code_tokens.push_back(tree.tokens[index].text);
  }

  const auto token_count = record.code_tokens.size();
  record.dfg =
      RemapEdges(graph.ExactEdges(), graph, begin, token_count, group_id);
  record.emit_approximate = config.flow.include_recursive_edges;
  if (record.emit_approximate) {
    record.dfg_approximate = RemapEdges(graph.ApproximateEdges(), graph,
                                        begin, token_count, group_id);
  }
  return record;
}

} // namespace erlflow
