#pragma once

#include <erlflow/interfaces.h>

namespace erlflow {

// Groups function clauses by (name, arity). A function whose clauses are
// interrupted by another function is rejected as a whole; the remaining
// groups of the file are still returned.
class ContiguousClauseGrouper : public ClauseGrouper {
public:
  GroupingResult Group(const SyntaxTree &tree) const override;
};

} // namespace erlflow
