#include <erlflow/flow_graph.h>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace erlflow {

std::vector<FlowEdge> FlowGraph::ExactEdges() const {
  std::vector<FlowEdge> exact;
  std::copy_if(edges.begin(), edges.end(), std::back_inserter(exact),
               [](const FlowEdge &edge) { return !edge.Approximate(); });
  return exact;
}

std::vector<FlowEdge> FlowGraph::ApproximateEdges() const {
  std::vector<FlowEdge> approximate;
  std::copy_if(edges.begin(), edges.end(), std::back_inserter(approximate),
               [](const FlowEdge &edge) { return edge.Approximate(); });
  return approximate;
}

std::string OccurrenceRoleName(OccurrenceRole role) {
  switch (role) {
  case OccurrenceRole::kBoundInPattern:
    return "bound-in-pattern";
  case OccurrenceRole::kReadInGuard:
    return "read-in-guard";
  case OccurrenceRole::kReadInBody:
    return "read-in-body";
  case OccurrenceRole::kSentInMessage:
    return "sent-in-message";
  case OccurrenceRole::kReceivedInPattern:
    return "received-in-pattern";
  case OccurrenceRole::kMatchInput:
    return "match-input";
  }
  return "unknown";
}

std::string EdgeKindName(EdgeKind kind) {
  switch (kind) {
  case EdgeKind::kDestructure:
    return "destructure";
  case EdgeKind::kMatch:
    return "match";
  case EdgeKind::kGuard:
    return "guard";
  case EdgeKind::kBody:
    return "body";
  case EdgeKind::kMessage:
    return "message";
  case EdgeKind::kRecursiveCall:
    return "recursive-call";
  }
  return "unknown";
}

void SortAndDeduplicateEdges(std::vector<FlowEdge> &edges) {
  const auto key = [](const FlowEdge &edge) {
    return std::make_tuple(edge.source, edge.target, edge.Approximate());
  };
  std::stable_sort(edges.begin(), edges.end(),
                   [&](const FlowEdge &left, const FlowEdge &right) {
                     return key(left) < key(right);
                   });
  edges.erase(std::unique(edges.begin(), edges.end(),
                          [&](const FlowEdge &left, const FlowEdge &right) {
                            return key(left) == key(right);
                          }),
              edges.end());
}

} // namespace erlflow
