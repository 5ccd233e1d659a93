#pragma once

#include <erlflow/interfaces.h>

namespace erlflow {

class NoDocumentationProvider : public DocumentationProvider {
public:
  std::string Lookup(const SyntaxTree &tree,
                     const ClauseGroup &group) const override;
};

// Reads the comment block directly above a function (or above its -spec).
// An EDoc @doc or @brief tag selects the tagged paragraph; otherwise the
// whole block is used. Comment markers are stripped and lines joined with
// single spaces.
class EdocDocumentationProvider : public DocumentationProvider {
public:
  std::string Lookup(const SyntaxTree &tree,
                     const ClauseGroup &group) const override;
};

} // namespace erlflow
