#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace erlflow {

enum class ErrorKind {
  kParse,
  kNonContiguousClause,
  kScope,
  kEmptyClauseGroup,
  kRecordValidation,
  kSinkWrite,
  kTimeout,
  kIo,
  kInternal
};

std::string ErrorKindName(ErrorKind kind);

class CorpusError : public std::runtime_error {
public:
  CorpusError(ErrorKind kind, const std::string &message);
  ErrorKind Kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class ParseError : public CorpusError {
public:
  ParseError(std::string path, std::size_t line, std::size_t column,
             const std::string &detail);

  const std::string &Path() const { return path_; }
  std::size_t Line() const { return line_; }
  std::size_t Column() const { return column_; }
  const std::string &Detail() const { return detail_; }

private:
  std::string path_;
  std::size_t line_;
  std::size_t column_;
  std::string detail_;
};

class NonContiguousClauseError : public CorpusError {
public:
  NonContiguousClauseError(std::string function, std::size_t arity,
                           std::size_t first_line, std::size_t repeat_line);

  const std::string &Function() const { return function_; }
  std::size_t Arity() const { return arity_; }
  std::size_t FirstLine() const { return first_line_; }
  std::size_t RepeatLine() const { return repeat_line_; }

private:
  std::string function_;
  std::size_t arity_;
  std::size_t first_line_;
  std::size_t repeat_line_;
};

class EmptyClauseGroupError : public CorpusError {
public:
  explicit EmptyClauseGroupError(const std::string &group_id);
};

class RecordValidationError : public CorpusError {
public:
  explicit RecordValidationError(const std::string &message);
};

class SinkWriteError : public CorpusError {
public:
  explicit SinkWriteError(const std::string &message);
};

class FileTimeoutError : public CorpusError {
public:
  explicit FileTimeoutError(const std::string &stage);
};

// A syntax tree nested deeper than the flow analysis walks.
class NestingDepthError : public CorpusError {
public:
  NestingDepthError(const std::string &group_id, std::size_t limit);
};

class SourceReadError : public CorpusError {
public:
  explicit SourceReadError(const std::string &path);
};

// A variable read with no reaching binding in its clause. Recorded, never
// thrown: the occurrence is dropped and analysis continues.
struct ScopeError {
  std::string variable;
  std::size_t clause_index = 0;
  std::size_t token_index = 0;
  std::size_t line = 0;
  std::size_t column = 0;
  bool in_guard = false;

  std::string Describe() const;
};

} // namespace erlflow
