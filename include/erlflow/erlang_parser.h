#pragma once

#include <erlflow/interfaces.h>

namespace erlflow {

// Recursive-descent parser for Erlang modules. Function forms are parsed in
// full; attributes other than -module and -export are kept as token spans
// only. The first branch of every preprocessor conditional is kept.
class ErlangParser : public SyntaxParser {
public:
  SyntaxTree Parse(const SourceFile &file,
                   const Deadline &deadline) const override;
};

} // namespace erlflow
