#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace erlflow {

enum class TokenKind {
  kAtom,
  kVariable,
  kInteger,
  kFloat,
  kChar,
  kString,
  kMacro,
  kKeyword,
  kPunctuation,
  kDot,
  kEnd
};

struct Token {
  TokenKind kind = TokenKind::kEnd;
  std::string text;
  std::size_t offset = 0;
  std::size_t length = 0;
  std::size_t line = 0;
  std::size_t column = 0;
};

struct Comment {
  std::string text;
  std::size_t offset = 0;
  std::size_t line = 0;
};

enum class NodeKind {
  kVariable,
  kWildcard,
  kAtom,
  kInteger,
  kFloat,
  kChar,
  kString,
  kMacro,
  kTuple,
  kList,
  kBinary,
  kBinaryElement,
  kMap,
  kMapUpdate,
  kMapField,
  kRecord,
  kRecordUpdate,
  kRecordField,
  kRecordIndex,
  kRecordAccess,
  kMatch,
  kSend,
  kBinaryOp,
  kUnaryOp,
  kCall,
  kRemote,
  kFun,
  kFunRef,
  kCase,
  kReceive,
  kIf,
  kTry,
  kBlock,
  kCatch,
  kCatchPattern,
  kClauseList,
  kListComprehension,
  kBinaryComprehension,
  kGenerator,
  kBinaryGenerator
};

struct SyntaxNode;

// Upper bound on expression nesting. Parsing and flow analysis recurse once
// per level, so deeper input is rejected instead of exhausting the stack.
constexpr std::size_t kMaxNestingDepth = 1000;

// Counts one nesting level for the lifetime of a recursive call.
class NestingGuard {
public:
  explicit NestingGuard(std::size_t &depth) : depth_(depth) { ++depth_; }
  ~NestingGuard() { --depth_; }
  NestingGuard(const NestingGuard &) = delete;
  NestingGuard &operator=(const NestingGuard &) = delete;

private:
  std::size_t &depth_;
};

// Guard sequence: alternatives separated by ';', each a ','-separated list
// of guard tests.
using GuardSequence = std::vector<std::vector<SyntaxNode>>;

// One pattern-guarded alternative: a function clause, or a case, receive,
// if, fun, or catch clause nested in an expression.
struct Clause {
  std::vector<SyntaxNode> patterns;
  GuardSequence guards;
  std::vector<SyntaxNode> body;
  std::size_t first_token = 0;
  std::size_t last_token = 0;
  // The ';' or '.' closing a function clause; equal to last_token otherwise.
  std::size_t terminator_token = 0;
};

struct SyntaxNode {
  NodeKind kind = NodeKind::kAtom;
  std::string text;
  // Index of the token that anchors this node in the file token sequence.
  std::size_t token = 0;
  std::vector<SyntaxNode> children;
  std::vector<Clause> clauses;
  // kList only: the last child is the tail after '|'.
  bool has_tail = false;
};

struct Attribute {
  std::string name;
  std::size_t first_token = 0;
  std::size_t last_token = 0;
};

struct FunctionClause {
  std::string name;
  std::size_t arity = 0;
  std::size_t form_index = 0;
  Clause clause;
};

struct SyntaxTree {
  std::string path;
  std::string module;
  std::vector<std::string> exports;
  std::vector<Token> tokens;
  std::vector<Comment> comments;
  std::vector<Attribute> attributes;
  std::vector<FunctionClause> functions;
};

struct ClauseGroupId {
  std::string module;
  std::string name;
  std::size_t arity = 0;

  std::string ToString() const;
};

struct ClauseGroup {
  ClauseGroupId id;
  std::vector<Clause> clauses;
  std::size_t first_token = 0;
  std::size_t last_token = 0;
};

std::string NodeKindName(NodeKind kind);
bool IsCompoundPattern(const SyntaxNode &node);

} // namespace erlflow
