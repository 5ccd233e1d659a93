#include <erlflow/erlang_parser.h>

#include <erlflow/erlang_lexer.h>
#include <erlflow/errors.h>

#include <array>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace erlflow {
namespace {

constexpr std::size_t kDeadlinePollInterval = 256;

struct OperatorLevel {
  std::set<std::string_view> operators;
  bool right_associative = false;
};

const std::array<OperatorLevel, 6> &OperatorLevels() {
  static const std::array<OperatorLevel, 6> kLevels = {{
      {{"orelse"}, false},
      {{"andalso"}, false},
      {{"==", "/=", "=<", "<", ">=", ">", "=:=", "=/="}, false},
      {{"++", "--"}, true},
      {{"+", "-", "bor", "bxor", "bsl", "bsr", "or", "xor"}, false},
      {{"/", "*", "div", "rem", "band", "and"}, false},
  }};
  return kLevels;
}

bool IsConditionalOpen(const std::string &name) {
  return name == "ifdef" || name == "ifndef" || name == "if";
}

SyntaxNode MakeNode(NodeKind kind, std::size_t token, std::string text = {}) {
  SyntaxNode node;
  node.kind = kind;
  node.token = token;
  node.text = std::move(text);
  return node;
}

SyntaxNode FlattenCatchPattern(SyntaxNode pattern) {
  if (pattern.kind != NodeKind::kRemote) {
    return pattern;
  }
  std::vector<SyntaxNode> parts;
  auto anchor = pattern.token;
  SyntaxNode *cursor = &pattern;
  std::vector<SyntaxNode> trailing;
  while (cursor->kind == NodeKind::kRemote && cursor->children.size() == 2) {
    anchor = cursor->token;
    trailing.insert(trailing.begin(), std::move(cursor->children[1]));
    cursor = &cursor->children[0];
  }
  parts.push_back(std::move(*cursor));
  for (auto &part : trailing) {
    parts.push_back(std::move(part));
  }
  auto flattened = MakeNode(NodeKind::kCatchPattern, anchor);
  flattened.children = std::move(parts);
  return flattened;
}

class Parser {
public:
  Parser(const SourceFile &file, LexResult lexed, const Deadline &deadline)
      : file_(file), deadline_(deadline) {
    tree_.path = file.path;
    tree_.tokens = std::move(lexed.tokens);
    tree_.comments = std::move(lexed.comments);
  }

  SyntaxTree Run() {
    while (Peek().kind != TokenKind::kEnd) {
      if (IsPunct("-")) {
        ParseAttribute();
      } else if (Peek().kind == TokenKind::kAtom) {
        ParseFunction();
      } else {
        Fail("expected attribute or function definition, found '" +
             Peek().text + "'");
      }
      ++form_index_;
    }
    if (tree_.module.empty()) {
      tree_.module = !file_.module.empty()
                         ? file_.module
                         : std::filesystem::path(file_.path).stem().string();
    }
    return std::move(tree_);
  }

private:
  const Token &Peek(std::size_t ahead = 0) const {
    const auto index = position_ + ahead;
    const auto &tokens = tree_.tokens;
    return index < tokens.size() ? tokens[index] : tokens.back();
  }

  std::size_t Next() {
    const auto index = position_;
    if (Peek().kind != TokenKind::kEnd) {
      ++position_;
    }
    if (++consumed_ % kDeadlinePollInterval == 0) {
      deadline_.Check("parse");
    }
    return index;
  }

  bool IsPunct(std::string_view text, std::size_t ahead = 0) const {
    const auto &token = Peek(ahead);
    return token.kind == TokenKind::kPunctuation && token.text == text;
  }

  bool IsKeyword(std::string_view text) const {
    const auto &token = Peek();
    return token.kind == TokenKind::kKeyword && token.text == text;
  }

  [[noreturn]] void Fail(const std::string &detail) const {
    const auto &token = Peek();
    if (token.kind == TokenKind::kEnd) {
      throw ParseError(file_.path, token.line, token.column,
                       "unexpected end of file");
    }
    throw ParseError(file_.path, token.line, token.column, detail);
  }

  NestingGuard Descend() {
    if (depth_ >= kMaxNestingDepth) {
      Fail("expression nesting too deep (limit " +
           std::to_string(kMaxNestingDepth) + ")");
    }
    return NestingGuard(depth_);
  }

  std::size_t Expect(std::string_view text) {
    if (!IsPunct(text)) {
      Fail("expected '" + std::string(text) + "' before '" + Peek().text +
           "'");
    }
    return Next();
  }

  std::size_t ExpectKeyword(std::string_view text) {
    if (!IsKeyword(text)) {
      Fail("expected '" + std::string(text) + "' before '" + Peek().text +
           "'");
    }
    return Next();
  }

  std::size_t SkipToDot(const char *unterminated) {
    while (Peek().kind != TokenKind::kDot) {
      if (Peek().kind == TokenKind::kEnd) {
        throw ParseError(file_.path, Peek().line, Peek().column,
                         unterminated);
      }
      Next();
    }
    return Next();
  }

  // Attributes

  void ParseAttribute() {
    const auto first = Next();
    const auto &name_token = Peek();
    if (name_token.kind != TokenKind::kAtom &&
        name_token.kind != TokenKind::kKeyword) {
      Fail("expected attribute name after '-'");
    }
    const auto name = AtomValue(name_token);
    Next();

    if (name == "module" && IsPunct("(") &&
        Peek(1).kind == TokenKind::kAtom) {
      tree_.module = AtomValue(Peek(1));
    }

    const auto name_position = position_;
    const auto last = SkipToDot("unterminated attribute");
    if (name == "export") {
      CollectExports(name_position, last);
    }
    tree_.attributes.push_back(Attribute{name, first, last});

    if (IsConditionalOpen(name)) {
      ++open_conditionals_;
    } else if (name == "endif") {
      if (open_conditionals_ > 0) {
        --open_conditionals_;
      }
    } else if ((name == "else" || name == "elif") && open_conditionals_ > 0) {
      SkipInactiveBranch();
    }
  }

  void CollectExports(std::size_t begin, std::size_t end) {
    const auto &tokens = tree_.tokens;
    for (auto index = begin; index + 2 < end; ++index) {
      if (tokens[index].kind == TokenKind::kAtom &&
          tokens[index + 1].kind == TokenKind::kPunctuation &&
          tokens[index + 1].text == "/" &&
          tokens[index + 2].kind == TokenKind::kInteger) {
        tree_.exports.push_back(AtomValue(tokens[index]) + "/" +
                                tokens[index + 2].text);
      }
    }
  }

  // Skips forms up to and including the -endif closing the current
  // conditional.
  void SkipInactiveBranch() {
    std::size_t nested = 0;
    while (Peek().kind != TokenKind::kEnd) {
      const bool is_attribute = IsPunct("-") &&
                                (Peek(1).kind == TokenKind::kAtom ||
                                 Peek(1).kind == TokenKind::kKeyword);
      if (is_attribute) {
        const auto name = AtomValue(Peek(1));
        if (IsConditionalOpen(name)) {
          ++nested;
        } else if (name == "endif") {
          if (nested == 0) {
            const auto first = position_;
            const auto last = SkipToDot("unterminated attribute");
            tree_.attributes.push_back(Attribute{name, first, last});
            --open_conditionals_;
            return;
          }
          --nested;
        }
      }
      SkipToDot("unterminated preprocessor branch");
    }
    Fail("missing -endif");
  }

  // Functions

  void ParseFunction() {
    const auto name = AtomValue(Peek());
    std::size_t arity = 0;
    bool first_clause = true;
    while (true) {
      if (Peek().kind != TokenKind::kAtom || AtomValue(Peek()) != name) {
        Fail("function clause head mismatch: expected '" + name + "'");
      }
      Clause clause;
      clause.first_token = Next();
      Expect("(");
      clause.patterns = ParseExprList(")");
      Expect(")");
      if (first_clause) {
        arity = clause.patterns.size();
        first_clause = false;
      } else if (clause.patterns.size() != arity) {
        Fail("function clause arity mismatch for '" + name + "'");
      }
      if (IsKeyword("when")) {
        Next();
        clause.guards = ParseGuardSequence();
      }
      Expect("->");
      clause.body = ParseExprSequence();
      clause.last_token = position_ - 1;

      if (Peek().kind == TokenKind::kEnd) {
        throw ParseError(file_.path, Peek().line, Peek().column,
                         "unterminated function clause '" + name + "'");
      }
      const bool more = IsPunct(";");
      if (!more && Peek().kind != TokenKind::kDot) {
        Fail("expected ';' or '.' after function clause, found '" +
             Peek().text + "'");
      }
      clause.terminator_token = Next();
      tree_.functions.push_back(
          FunctionClause{name, arity, form_index_, std::move(clause)});
      if (!more) {
        return;
      }
    }
  }

  // Clauses

  GuardSequence ParseGuardSequence() {
    GuardSequence sequence;
    while (true) {
      std::vector<SyntaxNode> tests;
      tests.push_back(ParseExpr());
      while (IsPunct(",")) {
        Next();
        tests.push_back(ParseExpr());
      }
      sequence.push_back(std::move(tests));
      if (!IsPunct(";")) {
        return sequence;
      }
      Next();
    }
  }

  Clause ParsePatternClause(bool catch_clause) {
    Clause clause;
    clause.first_token = position_;
    auto pattern = ParseExpr();
    if (catch_clause) {
      pattern = FlattenCatchPattern(std::move(pattern));
    }
    clause.patterns.push_back(std::move(pattern));
    if (IsKeyword("when")) {
      Next();
      clause.guards = ParseGuardSequence();
    }
    Expect("->");
    clause.body = ParseExprSequence();
    clause.last_token = position_ - 1;
    clause.terminator_token = clause.last_token;
    return clause;
  }

  std::vector<Clause> ParsePatternClauses(bool catch_clause = false) {
    std::vector<Clause> clauses;
    clauses.push_back(ParsePatternClause(catch_clause));
    while (IsPunct(";")) {
      Next();
      clauses.push_back(ParsePatternClause(catch_clause));
    }
    return clauses;
  }

  // Expressions

  std::vector<SyntaxNode> ParseExprSequence() {
    std::vector<SyntaxNode> body;
    body.push_back(ParseExpr());
    while (IsPunct(",")) {
      Next();
      body.push_back(ParseExpr());
    }
    return body;
  }

  std::vector<SyntaxNode> ParseExprList(std::string_view closer) {
    std::vector<SyntaxNode> items;
    if (IsPunct(closer)) {
      return items;
    }
    items.push_back(ParseExpr());
    while (IsPunct(",")) {
      Next();
      items.push_back(ParseExpr());
    }
    return items;
  }

  SyntaxNode ParseExpr() {
    const auto nesting = Descend();
    if (IsKeyword("catch")) {
      auto node = MakeNode(NodeKind::kCatch, Next());
      node.children.push_back(ParseExpr());
      return node;
    }
    return ParseMatch();
  }

  SyntaxNode ParseMatch() {
    auto left = ParseBinary(0);
    if (IsPunct("=") || IsPunct("!")) {
      const auto kind = IsPunct("=") ? NodeKind::kMatch : NodeKind::kSend;
      const auto anchor = Next();
      auto node = MakeNode(kind, anchor, tree_.tokens[anchor].text);
      node.children.push_back(std::move(left));
      node.children.push_back(ParseExpr());
      return node;
    }
    return left;
  }

  bool AtOperator(const OperatorLevel &level) const {
    const auto &token = Peek();
    return (token.kind == TokenKind::kPunctuation ||
            token.kind == TokenKind::kKeyword) &&
           level.operators.count(token.text) > 0;
  }

  SyntaxNode ParseBinary(std::size_t level_index) {
    const auto &levels = OperatorLevels();
    if (level_index >= levels.size()) {
      return ParseUnary();
    }
    const auto &level = levels[level_index];
    auto left = ParseBinary(level_index + 1);
    while (AtOperator(level)) {
      const auto anchor = Next();
      auto node =
          MakeNode(NodeKind::kBinaryOp, anchor, tree_.tokens[anchor].text);
      node.children.push_back(std::move(left));
      if (level.right_associative) {
        const auto nesting = Descend();
        node.children.push_back(ParseBinary(level_index));
      } else {
        node.children.push_back(ParseBinary(level_index + 1));
      }
      left = std::move(node);
      if (level.right_associative) {
        break;
      }
    }
    return left;
  }

  bool AtPrefixOperator() const {
    return IsPunct("+") || IsPunct("-") || IsKeyword("bnot") ||
           IsKeyword("not");
  }

  SyntaxNode ParseUnary() {
    if (AtPrefixOperator()) {
      const auto nesting = Descend();
      const auto anchor = Next();
      auto node =
          MakeNode(NodeKind::kUnaryOp, anchor, tree_.tokens[anchor].text);
      node.children.push_back(ParseUnary());
      return node;
    }
    return ParsePostfix();
  }

  SyntaxNode ParsePostfix() {
    auto node = ParsePrimary();
    while (true) {
      if (IsPunct("#")) {
        node = ParseRecordOrMapSuffix(std::move(node));
      } else if (IsPunct(":")) {
        const auto anchor = Next();
        auto remote = MakeNode(NodeKind::kRemote, anchor, ":");
        remote.children.push_back(std::move(node));
        remote.children.push_back(ParsePrimary());
        node = std::move(remote);
      } else if (IsPunct("(")) {
        auto call = MakeNode(NodeKind::kCall, node.token);
        if (node.kind == NodeKind::kAtom) {
          call.text = node.text;
        } else if (node.kind == NodeKind::kRemote &&
                   node.children[1].kind == NodeKind::kAtom) {
          call.text = node.children[1].text;
        }
        Next();
        auto arguments = ParseExprList(")");
        Expect(")");
        call.children.push_back(std::move(node));
        for (auto &argument : arguments) {
          call.children.push_back(std::move(argument));
        }
        node = std::move(call);
      } else {
        return node;
      }
    }
  }

  std::string ExpectRecordName() {
    if (Peek().kind != TokenKind::kAtom && Peek().kind != TokenKind::kKeyword) {
      Fail("expected record name after '#'");
    }
    return AtomValue(tree_.tokens[Next()]);
  }

  SyntaxNode ParseFieldAtom() {
    const auto &token = Peek();
    if (token.kind != TokenKind::kAtom && token.kind != TokenKind::kKeyword) {
      Fail("expected record field name");
    }
    const auto index = Next();
    return MakeNode(NodeKind::kAtom, index, AtomValue(tree_.tokens[index]));
  }

  SyntaxNode ParseRecordOrMapSuffix(SyntaxNode base) {
    const auto anchor = Next(); // '#'
    if (IsPunct("{")) {
      auto update = MakeNode(NodeKind::kMapUpdate, anchor);
      update.children.push_back(std::move(base));
      for (auto &field : ParseMapFields()) {
        update.children.push_back(std::move(field));
      }
      return update;
    }
    const auto name = ExpectRecordName();
    if (IsPunct(".")) {
      Next();
      auto access = MakeNode(NodeKind::kRecordAccess, anchor, name);
      access.children.push_back(std::move(base));
      access.children.push_back(ParseFieldAtom());
      return access;
    }
    auto update = MakeNode(NodeKind::kRecordUpdate, anchor, name);
    update.children.push_back(std::move(base));
    for (auto &field : ParseRecordFields()) {
      update.children.push_back(std::move(field));
    }
    return update;
  }

  std::vector<SyntaxNode> ParseMapFields() {
    Expect("{");
    std::vector<SyntaxNode> fields;
    while (!IsPunct("}")) {
      auto key = ParseExpr();
      if (!IsPunct("=>") && !IsPunct(":=")) {
        Fail("expected '=>' or ':=' in map expression");
      }
      const auto anchor = Next();
      auto field =
          MakeNode(NodeKind::kMapField, anchor, tree_.tokens[anchor].text);
      field.children.push_back(std::move(key));
      field.children.push_back(ParseExpr());
      fields.push_back(std::move(field));
      if (!IsPunct(",")) {
        break;
      }
      Next();
    }
    Expect("}");
    return fields;
  }

  std::vector<SyntaxNode> ParseRecordFields() {
    Expect("{");
    std::vector<SyntaxNode> fields;
    while (!IsPunct("}")) {
      const auto &token = Peek();
      const bool named = token.kind == TokenKind::kAtom ||
                         token.kind == TokenKind::kKeyword ||
                         (token.kind == TokenKind::kVariable &&
                          token.text == "_");
      if (!named) {
        Fail("expected record field name");
      }
      const auto anchor = Next();
      auto field = MakeNode(NodeKind::kRecordField, anchor,
                            AtomValue(tree_.tokens[anchor]));
      Expect("=");
      field.children.push_back(ParseExpr());
      fields.push_back(std::move(field));
      if (!IsPunct(",")) {
        break;
      }
      Next();
    }
    Expect("}");
    return fields;
  }

  SyntaxNode ParsePrimary() {
    const auto nesting = Descend();
    const auto &token = Peek();
    switch (token.kind) {
    case TokenKind::kVariable: {
      const auto index = Next();
      const auto &text = tree_.tokens[index].text;
      return MakeNode(text == "_" ? NodeKind::kWildcard : NodeKind::kVariable,
                      index, text);
    }
    case TokenKind::kAtom: {
      const auto index = Next();
      return MakeNode(NodeKind::kAtom, index, AtomValue(tree_.tokens[index]));
    }
    case TokenKind::kInteger:
      return MakeNode(NodeKind::kInteger, Next(), token.text);
    case TokenKind::kFloat:
      return MakeNode(NodeKind::kFloat, Next(), token.text);
    case TokenKind::kChar:
      return MakeNode(NodeKind::kChar, Next(), token.text);
    case TokenKind::kString:
      return ParseStrings();
    case TokenKind::kMacro:
      return ParseMacro();
    case TokenKind::kKeyword:
      return ParseKeywordExpr();
    case TokenKind::kPunctuation:
      return ParseBracketed();
    case TokenKind::kDot:
    case TokenKind::kEnd:
      break;
    }
    Fail("unexpected '" + token.text + "' in expression");
  }

  SyntaxNode ParseStrings() {
    auto node = MakeNode(NodeKind::kString, position_, Peek().text);
    Next();
    while (Peek().kind == TokenKind::kString) {
      node.text += tree_.tokens[Next()].text;
    }
    return node;
  }

  SyntaxNode ParseMacro() {
    const auto index = Next();
    auto node = MakeNode(NodeKind::kMacro, index, tree_.tokens[index].text);
    if (IsPunct("(")) {
      Next();
      node.children = ParseExprList(")");
      Expect(")");
    }
    return node;
  }

  SyntaxNode ParseBracketed() {
    if (IsPunct("(")) {
      Next();
      auto inner = ParseExpr();
      Expect(")");
      return inner;
    }
    if (IsPunct("{")) {
      auto tuple = MakeNode(NodeKind::kTuple, Next());
      tuple.children = ParseExprList("}");
      Expect("}");
      return tuple;
    }
    if (IsPunct("[")) {
      return ParseList();
    }
    if (IsPunct("<<")) {
      return ParseBitString();
    }
    if (IsPunct("#")) {
      const auto anchor = Next();
      if (IsPunct("{")) {
        auto map = MakeNode(NodeKind::kMap, anchor);
        map.children = ParseMapFields();
        return map;
      }
      const auto name = ExpectRecordName();
      if (IsPunct(".")) {
        Next();
        auto index = MakeNode(NodeKind::kRecordIndex, anchor, name);
        index.children.push_back(ParseFieldAtom());
        return index;
      }
      auto record = MakeNode(NodeKind::kRecord, anchor, name);
      record.children = ParseRecordFields();
      return record;
    }
    Fail("unexpected '" + Peek().text + "' in expression");
  }

  SyntaxNode ParseList() {
    const auto anchor = Next(); // '['
    auto list = MakeNode(NodeKind::kList, anchor);
    if (IsPunct("]")) {
      Next();
      return list;
    }
    auto head = ParseExpr();
    if (IsPunct("||")) {
      Next();
      auto comprehension = MakeNode(NodeKind::kListComprehension, anchor);
      comprehension.children.push_back(std::move(head));
      ParseQualifiers(comprehension.children);
      Expect("]");
      return comprehension;
    }
    list.children.push_back(std::move(head));
    while (IsPunct(",")) {
      Next();
      list.children.push_back(ParseExpr());
    }
    if (IsPunct("|")) {
      Next();
      list.children.push_back(ParseExpr());
      list.has_tail = true;
    }
    Expect("]");
    return list;
  }

  void ParseQualifiers(std::vector<SyntaxNode> &out) {
    while (true) {
      auto expr = ParseExpr();
      if (IsPunct("<-") || IsPunct("<=")) {
        const auto kind =
            IsPunct("<-") ? NodeKind::kGenerator : NodeKind::kBinaryGenerator;
        const auto anchor = Next();
        auto generator = MakeNode(kind, anchor, tree_.tokens[anchor].text);
        generator.children.push_back(std::move(expr));
        generator.children.push_back(ParseExpr());
        out.push_back(std::move(generator));
      } else {
        out.push_back(std::move(expr));
      }
      if (!IsPunct(",")) {
        return;
      }
      Next();
    }
  }

  SyntaxNode ParseBitString() {
    const auto anchor = Next(); // '<<'
    auto binary = MakeNode(NodeKind::kBinary, anchor);
    if (IsPunct(">>")) {
      Next();
      return binary;
    }
    auto head = ParseBinaryElement();
    if (IsPunct("||")) {
      Next();
      auto comprehension = MakeNode(NodeKind::kBinaryComprehension, anchor);
      comprehension.children.push_back(std::move(head));
      ParseQualifiers(comprehension.children);
      Expect(">>");
      return comprehension;
    }
    binary.children.push_back(std::move(head));
    while (IsPunct(",")) {
      Next();
      binary.children.push_back(ParseBinaryElement());
    }
    Expect(">>");
    return binary;
  }

  // Element value and size are restricted to primaries so that ':' and '/'
  // keep their segment meaning.
  SyntaxNode ParseBinaryElement() {
    auto element = MakeNode(NodeKind::kBinaryElement, position_);
    if (IsPunct("+") || IsPunct("-") || IsKeyword("bnot") ||
        IsKeyword("not")) {
      const auto anchor = Next();
      auto value =
          MakeNode(NodeKind::kUnaryOp, anchor, tree_.tokens[anchor].text);
      value.children.push_back(ParsePrimary());
      element.children.push_back(std::move(value));
    } else {
      element.children.push_back(ParsePrimary());
    }
    if (IsPunct(":")) {
      Next();
      element.children.push_back(ParsePrimary());
    }
    if (IsPunct("/")) {
      Next();
      element.text = ParseTypeSpecifiers();
    }
    return element;
  }

  std::string ParseTypeSpecifiers() {
    std::string specifiers;
    while (true) {
      if (Peek().kind != TokenKind::kAtom) {
        Fail("expected binary type specifier");
      }
      specifiers += tree_.tokens[Next()].text;
      if (IsPunct(":")) {
        Next();
        if (Peek().kind != TokenKind::kInteger) {
          Fail("expected integer unit size");
        }
        specifiers += ":" + tree_.tokens[Next()].text;
      }
      if (!IsPunct("-")) {
        return specifiers;
      }
      Next();
      specifiers += "-";
    }
  }

  SyntaxNode ParseKeywordExpr() {
    const auto &text = Peek().text;
    if (text == "fun") {
      return ParseFun();
    }
    if (text == "case") {
      const auto anchor = Next();
      auto node = MakeNode(NodeKind::kCase, anchor);
      node.children.push_back(ParseExpr());
      ExpectKeyword("of");
      node.clauses = ParsePatternClauses();
      ExpectKeyword("end");
      return node;
    }
    if (text == "receive") {
      return ParseReceive();
    }
    if (text == "if") {
      return ParseIf();
    }
    if (text == "try") {
      return ParseTry();
    }
    if (text == "begin") {
      const auto anchor = Next();
      auto block = MakeNode(NodeKind::kBlock, anchor);
      block.children = ParseExprSequence();
      ExpectKeyword("end");
      return block;
    }
    Fail("unexpected keyword '" + text + "' in expression");
  }

  SyntaxNode ParseReceive() {
    const auto anchor = Next();
    auto node = MakeNode(NodeKind::kReceive, anchor);
    if (!IsKeyword("after")) {
      node.clauses = ParsePatternClauses();
    }
    if (IsKeyword("after")) {
      Next();
      node.children.push_back(ParseExpr());
      Expect("->");
      auto block = MakeNode(NodeKind::kBlock, position_);
      block.children = ParseExprSequence();
      node.children.push_back(std::move(block));
    }
    ExpectKeyword("end");
    return node;
  }

  SyntaxNode ParseIf() {
    const auto anchor = Next();
    auto node = MakeNode(NodeKind::kIf, anchor);
    while (true) {
      Clause clause;
      clause.first_token = position_;
      clause.guards = ParseGuardSequence();
      Expect("->");
      clause.body = ParseExprSequence();
      clause.last_token = position_ - 1;
      clause.terminator_token = clause.last_token;
      node.clauses.push_back(std::move(clause));
      if (!IsPunct(";")) {
        break;
      }
      Next();
    }
    ExpectKeyword("end");
    return node;
  }

  SyntaxNode ParseTry() {
    const auto anchor = Next();
    auto node = MakeNode(NodeKind::kTry, anchor);

    auto body = MakeNode(NodeKind::kBlock, position_);
    body.children = ParseExprSequence();
    auto of_clauses = MakeNode(NodeKind::kClauseList, position_, "of");
    if (IsKeyword("of")) {
      Next();
      of_clauses.clauses = ParsePatternClauses();
    }
    auto catch_clauses = MakeNode(NodeKind::kClauseList, position_, "catch");
    if (IsKeyword("catch")) {
      Next();
      catch_clauses.clauses = ParsePatternClauses(true);
    }
    auto after = MakeNode(NodeKind::kBlock, position_, "after");
    if (IsKeyword("after")) {
      Next();
      after.children = ParseExprSequence();
    }
    if (catch_clauses.clauses.empty() && after.children.empty()) {
      Fail("expected 'catch' or 'after' in try expression");
    }
    ExpectKeyword("end");

    node.children.push_back(std::move(body));
    node.children.push_back(std::move(of_clauses));
    node.children.push_back(std::move(catch_clauses));
    node.children.push_back(std::move(after));
    return node;
  }

  SyntaxNode ParseFun() {
    const auto anchor = Next();
    const bool named = Peek().kind == TokenKind::kVariable && IsPunct("(", 1);
    if (IsPunct("(") || named) {
      auto node = MakeNode(NodeKind::kFun, anchor);
      if (named) {
        const auto index = position_;
        node.text = Peek().text;
        node.children.push_back(
            MakeNode(NodeKind::kVariable, index, node.text));
      }
      while (true) {
        if (named) {
          if (Peek().kind != TokenKind::kVariable || Peek().text != node.text) {
            Fail("named fun clause head mismatch");
          }
          Next();
        }
        Clause clause;
        clause.first_token = position_;
        Expect("(");
        clause.patterns = ParseExprList(")");
        Expect(")");
        if (IsKeyword("when")) {
          Next();
          clause.guards = ParseGuardSequence();
        }
        Expect("->");
        clause.body = ParseExprSequence();
        clause.last_token = position_ - 1;
        clause.terminator_token = clause.last_token;
        node.clauses.push_back(std::move(clause));
        if (!IsPunct(";")) {
          break;
        }
        Next();
      }
      ExpectKeyword("end");
      return node;
    }
    return ParseFunReference(anchor);
  }

  SyntaxNode ParseFunReferencePart(SyntaxNode &reference) {
    const auto &token = Peek();
    if (token.kind == TokenKind::kVariable) {
      const auto index = Next();
      auto part = MakeNode(NodeKind::kVariable, index, tree_.tokens[index].text);
      reference.children.push_back(part);
      return part;
    }
    if (token.kind == TokenKind::kAtom) {
      const auto index = Next();
      return MakeNode(NodeKind::kAtom, index, AtomValue(tree_.tokens[index]));
    }
    if (token.kind == TokenKind::kMacro) {
      const auto index = Next();
      return MakeNode(NodeKind::kMacro, index, tree_.tokens[index].text);
    }
    if (token.kind == TokenKind::kInteger) {
      const auto index = Next();
      return MakeNode(NodeKind::kInteger, index, tree_.tokens[index].text);
    }
    Fail("malformed fun reference");
  }

  SyntaxNode ParseFunReference(std::size_t anchor) {
    auto reference = MakeNode(NodeKind::kFunRef, anchor);
    auto name = ParseFunReferencePart(reference);
    if (IsPunct(":")) {
      Next();
      const auto function = ParseFunReferencePart(reference);
      name.text += ":" + function.text;
    }
    Expect("/");
    const auto arity = ParseFunReferencePart(reference);
    reference.text = name.text + "/" + arity.text;
    return reference;
  }

  const SourceFile &file_;
  const Deadline &deadline_;
  SyntaxTree tree_;
  std::size_t position_ = 0;
  std::size_t consumed_ = 0;
  std::size_t depth_ = 0;
  std::size_t form_index_ = 0;
  std::size_t open_conditionals_ = 0;
};

} // namespace

SyntaxTree ErlangParser::Parse(const SourceFile &file,
                               const Deadline &deadline) const {
  deadline.Check("parse");
  auto lexed = Tokenize(file.content, file.path);
  Parser parser(file, std::move(lexed), deadline);
  return parser.Run();
}

} // namespace erlflow
