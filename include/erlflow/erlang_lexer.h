#pragma once

#include <erlflow/syntax_tree.h>

#include <string>
#include <string_view>
#include <vector>

namespace erlflow {

struct LexResult {
  std::vector<Token> tokens;
  std::vector<Comment> comments;
};

// Splits Erlang source into tokens. Comments are collected on the side and
// never appear in the token stream. The final token is always kEnd. Throws
// ParseError on unterminated literals or characters outside the grammar.
LexResult Tokenize(std::string_view source, const std::string &path);

bool IsReservedWord(std::string_view word);
std::string AtomValue(const Token &token);

} // namespace erlflow
