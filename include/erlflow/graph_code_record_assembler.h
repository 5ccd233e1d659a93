#pragma once

#include <erlflow/interfaces.h>

namespace erlflow {

// Assembles one GraphCodeBERT-style record per clause group. Flow edges are
// remapped from occurrence indices to indices into the group's own token
// sequence; any endpoint outside that sequence fails the record.
class GraphCodeRecordAssembler : public RecordAssembler {
public:
  TrainingRecord Assemble(const SourceFile &file, const SyntaxTree &tree,
                          const ClauseGroup &group, const FlowGraph &graph,
                          std::string docstring,
                          const CorpusConfig &config) const override;
};

// Number of source lines spanned by the group, from its first head to the
// closing '.'.
std::size_t GroupLineSpan(const SyntaxTree &tree, const ClauseGroup &group);

} // namespace erlflow
