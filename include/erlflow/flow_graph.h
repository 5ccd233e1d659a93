#pragma once

#include <erlflow/errors.h>

#include <cstddef>
#include <string>
#include <vector>

namespace erlflow {

enum class OccurrenceRole {
  kBoundInPattern,
  kReadInGuard,
  kReadInBody,
  kSentInMessage,
  kReceivedInPattern,
  kMatchInput
};

struct VariableOccurrence {
  std::string name;
  OccurrenceRole role = OccurrenceRole::kReadInBody;
  std::size_t clause_index = 0;
  std::size_t token_index = 0;
  // Match-input nodes stand for the value matched by a compound pattern and
  // are anchored on the pattern's opening token.
  bool synthetic = false;
};

enum class EdgeKind {
  kDestructure,
  kMatch,
  kGuard,
  kBody,
  kMessage,
  kRecursiveCall
};

struct FlowEdge {
  std::size_t source = 0;
  std::size_t target = 0;
  EdgeKind kind = EdgeKind::kBody;
  // Heuristic edges: recursive-call dispatch, and messages sent from another
  // clause of the group.
  bool approximate = false;

  bool Approximate() const { return approximate; }
};

// Occurrence indices double as ranks: occurrences are numbered in traversal
// order, and edges are sorted by (source, target).
struct FlowGraph {
  std::vector<VariableOccurrence> occurrences;
  std::vector<FlowEdge> edges;
  std::vector<ScopeError> scope_errors;

  std::vector<FlowEdge> ExactEdges() const;
  std::vector<FlowEdge> ApproximateEdges() const;
};

std::string OccurrenceRoleName(OccurrenceRole role);
std::string EdgeKindName(EdgeKind kind);
void SortAndDeduplicateEdges(std::vector<FlowEdge> &edges);

} // namespace erlflow
