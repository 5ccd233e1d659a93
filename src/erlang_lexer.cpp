#include <erlflow/erlang_lexer.h>

#include <erlflow/errors.h>

#include <array>
#include <cctype>
#include <set>

namespace erlflow {
namespace {

constexpr std::array<std::string_view, 3> kThreeCharOperators = {"=:=", "=/=",
                                                                 "..."};
constexpr std::array<std::string_view, 16> kTwoCharOperators = {
    "->", "=>", ":=", "::", "||", "<-", "<=", "=<",
    ">=", "==", "/=", "++", "--", "..", "<<", ">>"};
constexpr std::string_view kSingleCharOperators = "()[]{},;:|=!+-*/<>#.";

bool IsNameChar(char character) {
  const auto code = static_cast<unsigned char>(character);
  return std::isalnum(code) != 0 || character == '_' || character == '@';
}

bool IsLowercaseStart(char character) {
  return character >= 'a' && character <= 'z';
}

bool IsVariableStart(char character) {
  return (character >= 'A' && character <= 'Z') || character == '_';
}

bool IsDigit(char character) { return character >= '0' && character <= '9'; }

bool IsWhitespace(char character) {
  return character == ' ' || character == '\t' || character == '\n' ||
         character == '\r' || character == '\f' || character == '\v';
}

class Lexer {
public:
  Lexer(std::string_view source, const std::string &path)
      : source_(source), path_(path) {}

  LexResult Run() {
    while (true) {
      SkipWhitespace();
      if (AtEnd()) {
        break;
      }
      const auto character = Peek();
      if (character == '%') {
        LexComment();
      } else if (IsLowercaseStart(character)) {
        LexName(TokenKind::kAtom);
      } else if (IsVariableStart(character)) {
        LexName(TokenKind::kVariable);
      } else if (IsDigit(character)) {
        LexNumber();
      } else if (character == '$') {
        LexChar();
      } else if (character == '"') {
        LexQuoted('"', TokenKind::kString, "unterminated string literal");
      } else if (character == '\'') {
        LexQuoted('\'', TokenKind::kAtom, "unterminated quoted atom");
      } else if (character == '?') {
        LexMacro();
      } else {
        LexPunctuation();
      }
    }

    Token end;
    end.kind = TokenKind::kEnd;
    end.offset = source_.size();
    end.line = line_;
    end.column = column_;
    result_.tokens.push_back(end);
    return std::move(result_);
  }

private:
  bool AtEnd() const { return position_ >= source_.size(); }

  char Peek(std::size_t ahead = 0) const {
    const auto index = position_ + ahead;
    return index < source_.size() ? source_[index] : '\0';
  }

  void Advance(std::size_t count = 1) {
    for (std::size_t i = 0; i < count && !AtEnd(); ++i) {
      if (source_[position_] == '\n') {
        ++line_;
        column_ = 1;
      } else {
        ++column_;
      }
      ++position_;
    }
  }

  [[noreturn]] void Fail(const std::string &detail, std::size_t line,
                         std::size_t column) const {
    throw ParseError(path_, line, column, detail);
  }

  void Emit(TokenKind kind, std::size_t start, std::size_t line,
            std::size_t column) {
    Token token;
    token.kind = kind;
    token.offset = start;
    token.length = position_ - start;
    token.text = std::string(source_.substr(start, token.length));
    token.line = line;
    token.column = column;
    if (kind == TokenKind::kAtom && token.text.front() != '\'' &&
        IsReservedWord(token.text)) {
      token.kind = TokenKind::kKeyword;
    }
    result_.tokens.push_back(std::move(token));
  }

  void SkipWhitespace() {
    while (!AtEnd() && IsWhitespace(Peek())) {
      Advance();
    }
  }

  void LexComment() {
    const auto start = position_;
    const auto line = line_;
    while (!AtEnd() && Peek() != '\n') {
      Advance();
    }
    Comment comment;
    comment.offset = start;
    comment.line = line;
    comment.text = std::string(source_.substr(start, position_ - start));
    result_.comments.push_back(std::move(comment));
  }

  void LexName(TokenKind kind) {
    const auto start = position_;
    const auto line = line_;
    const auto column = column_;
    while (!AtEnd() && IsNameChar(Peek())) {
      Advance();
    }
    Emit(kind, start, line, column);
  }

  void ConsumeDigits(bool allow_letters) {
    while (!AtEnd()) {
      const auto character = Peek();
      const bool accepted =
          IsDigit(character) || character == '_' ||
          (allow_letters &&
           std::isalpha(static_cast<unsigned char>(character)) != 0);
      if (!accepted) {
        break;
      }
      Advance();
    }
  }

  void LexNumber() {
    const auto start = position_;
    const auto line = line_;
    const auto column = column_;
    ConsumeDigits(false);

    if (Peek() == '#' &&
        std::isalnum(static_cast<unsigned char>(Peek(1))) != 0) {
      Advance();
      ConsumeDigits(true);
      Emit(TokenKind::kInteger, start, line, column);
      return;
    }

    auto kind = TokenKind::kInteger;
    if (Peek() == '.' && IsDigit(Peek(1))) {
      kind = TokenKind::kFloat;
      Advance();
      ConsumeDigits(false);
      if (Peek() == 'e' || Peek() == 'E') {
        const bool signed_exponent =
            (Peek(1) == '+' || Peek(1) == '-') && IsDigit(Peek(2));
        if (signed_exponent || IsDigit(Peek(1))) {
          Advance(signed_exponent ? 2 : 1);
          ConsumeDigits(false);
        }
      }
    }
    Emit(kind, start, line, column);
  }

  void ConsumeUtf8Character() {
    const auto lead = static_cast<unsigned char>(Peek());
    Advance();
    if (lead < 0x80) {
      return;
    }
    while (!AtEnd() && (static_cast<unsigned char>(Peek()) & 0xC0) == 0x80) {
      Advance();
    }
  }

  void ConsumeEscape() {
    Advance(); // backslash
    if (AtEnd()) {
      return;
    }
    const auto character = Peek();
    if (character >= '0' && character <= '7') {
      for (int i = 0; i < 3 && Peek() >= '0' && Peek() <= '7'; ++i) {
        Advance();
      }
      return;
    }
    if (character == 'x') {
      Advance();
      if (Peek() == '{') {
        while (!AtEnd() && Peek() != '}') {
          Advance();
        }
        Advance();
        return;
      }
      for (int i = 0;
           i < 2 && std::isxdigit(static_cast<unsigned char>(Peek())) != 0;
           ++i) {
        Advance();
      }
      return;
    }
    if (character == '^') {
      Advance(2);
      return;
    }
    ConsumeUtf8Character();
  }

  void LexChar() {
    const auto start = position_;
    const auto line = line_;
    const auto column = column_;
    Advance(); // '$'
    if (AtEnd()) {
      Fail("unterminated character literal", line, column);
    }
    if (Peek() == '\\') {
      ConsumeEscape();
    } else {
      ConsumeUtf8Character();
    }
    Emit(TokenKind::kChar, start, line, column);
  }

  void LexQuoted(char quote, TokenKind kind, const char *unterminated) {
    const auto start = position_;
    const auto line = line_;
    const auto column = column_;
    Advance();
    while (true) {
      if (AtEnd()) {
        Fail(unterminated, line, column);
      }
      const auto character = Peek();
      if (character == '\\') {
        ConsumeEscape();
        continue;
      }
      Advance();
      if (character == quote) {
        break;
      }
    }
    Emit(kind, start, line, column);
  }

  void LexMacro() {
    const auto start = position_;
    const auto line = line_;
    const auto column = column_;
    Advance();
    if (Peek() == '=') {
      Fail("unsupported grammar extension: '?=' of maybe expressions", line,
           column);
    }
    if (Peek() == '?') {
      Advance();
    }
    if (Peek() == '\'') {
      LexQuotedMacroName(line, column);
    } else if (IsLowercaseStart(Peek()) || IsVariableStart(Peek())) {
      while (!AtEnd() && IsNameChar(Peek())) {
        Advance();
      }
    } else {
      Fail("expected macro name after '?'", line, column);
    }
    Emit(TokenKind::kMacro, start, line, column);
  }

  void LexQuotedMacroName(std::size_t line, std::size_t column) {
    Advance();
    while (!AtEnd() && Peek() != '\'') {
      if (Peek() == '\\') {
        ConsumeEscape();
        continue;
      }
      Advance();
    }
    if (AtEnd()) {
      Fail("unterminated quoted macro name", line, column);
    }
    Advance();
  }

  bool Matches(std::string_view candidate) const {
    return source_.substr(position_, candidate.size()) == candidate;
  }

  void LexPunctuation() {
    const auto start = position_;
    const auto line = line_;
    const auto column = column_;

    if (Peek() == '.' && Peek(1) != '.' &&
        (position_ + 1 >= source_.size() || IsWhitespace(Peek(1)) ||
         Peek(1) == '%')) {
      Advance();
      Emit(TokenKind::kDot, start, line, column);
      return;
    }

    for (const auto candidate : kThreeCharOperators) {
      if (Matches(candidate)) {
        Advance(candidate.size());
        Emit(TokenKind::kPunctuation, start, line, column);
        return;
      }
    }
    for (const auto candidate : kTwoCharOperators) {
      if (Matches(candidate)) {
        Advance(candidate.size());
        Emit(TokenKind::kPunctuation, start, line, column);
        return;
      }
    }
    if (kSingleCharOperators.find(Peek()) != std::string_view::npos) {
      Advance();
      Emit(TokenKind::kPunctuation, start, line, column);
      return;
    }

    Fail(std::string("unexpected character '") + Peek() + "'", line, column);
  }

  std::string_view source_;
  const std::string &path_;
  std::size_t position_ = 0;
  std::size_t line_ = 1;
  std::size_t column_ = 1;
  LexResult result_;
};

} // namespace

bool IsReservedWord(std::string_view word) {
  static const std::set<std::string_view> kReserved = {
      "after", "and",  "andalso", "band",  "begin",   "bnot", "bor",
      "bsl",   "bsr",  "bxor",    "case",  "catch",   "cond", "div",
      "end",   "fun",  "if",      "let",   "not",     "of",   "or",
      "orelse", "receive", "rem", "try",   "when",    "xor"};
  return kReserved.count(word) > 0;
}

std::string AtomValue(const Token &token) {
  if (token.text.size() >= 2 && token.text.front() == '\'' &&
      token.text.back() == '\'') {
    return token.text.substr(1, token.text.size() - 2);
  }
  return token.text;
}

LexResult Tokenize(std::string_view source, const std::string &path) {
  Lexer lexer(source, path);
  return lexer.Run();
}

} // namespace erlflow
