#pragma once

#include <erlflow/interfaces.h>

namespace erlflow {

// Builds the variable data-flow graph of one clause group.
//
// Every clause is an independent scope. Parameter patterns are walked left to
// right; each variable leaf becomes a binding occurrence, and each compound
// pattern gets a synthetic match-input occurrence with one destructure edge
// per directly dominated leaf. Guard and body reads resolve to the reaching
// bindings of their clause. Case, receive and if branches bind in private
// scopes; their new names are visible after the expression as the union of
// the branch bindings.
//
// A second pass links sends to the current process with compatible receive
// patterns of the group. Inside one clause the send must come first. When
// approximate edges are enabled it also links sends from other clauses of the
// group, and recursive call arguments to the parameters of every clause they
// may dispatch to. Both of those are tagged approximate.
class VariableFlowAnalyzer : public FlowAnalyzer {
public:
  FlowGraph Analyze(const ClauseGroup &group, const FlowOptions &options,
                    const Deadline &deadline) const override;
};

} // namespace erlflow
