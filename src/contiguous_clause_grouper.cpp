#include <erlflow/contiguous_clause_grouper.h>

#include <map>
#include <optional>
#include <set>
#include <utility>

namespace erlflow {
namespace {

using FunctionKey = std::pair<std::string, std::size_t>;

std::size_t LineOf(const SyntaxTree &tree, std::size_t token) {
  return token < tree.tokens.size() ? tree.tokens[token].line : 0;
}

} // namespace

GroupingResult
ContiguousClauseGrouper::Group(const SyntaxTree &tree) const {
  GroupingResult result;
  std::map<FunctionKey, std::size_t> group_index;
  std::set<FunctionKey> rejected;
  std::optional<FunctionKey> previous;

  for (const auto &function : tree.functions) {
    FunctionKey key{function.name, function.arity};
    const bool continues = previous.has_value() && *previous == key;
    previous = key;

    const auto existing = group_index.find(key);
    if (existing == group_index.end()) {
      ClauseGroup group;
      group.id = ClauseGroupId{tree.module, function.name, function.arity};
      group.first_token = function.clause.first_token;
      group.last_token = function.clause.terminator_token;
      group.clauses.push_back(function.clause);
      group_index.emplace(key, result.groups.size());
      result.groups.push_back(std::move(group));
      continue;
    }

    auto &group = result.groups[existing->second];
    if (!continues) {
      if (rejected.insert(key).second) {
        result.rejected.emplace_back(
            function.name, function.arity, LineOf(tree, group.first_token),
            LineOf(tree, function.clause.first_token));
      }
      continue;
    }
    if (rejected.count(key) == 0) {
      group.clauses.push_back(function.clause);
      group.last_token = function.clause.terminator_token;
    }
  }

  std::vector<ClauseGroup> kept;
  kept.reserve(result.groups.size());
  for (auto &group : result.groups) {
    if (rejected.count({group.id.name, group.id.arity}) == 0) {
      kept.push_back(std::move(group));
    }
  }
  result.groups = std::move(kept);
  return result;
}

} // namespace erlflow
