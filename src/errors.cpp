#include <erlflow/errors.h>

#include <utility>

namespace erlflow {

std::string ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kParse:
    return "ParseError";
  case ErrorKind::kNonContiguousClause:
    return "NonContiguousClauseError";
  case ErrorKind::kScope:
    return "ScopeError";
  case ErrorKind::kEmptyClauseGroup:
    return "EmptyClauseGroupError";
  case ErrorKind::kRecordValidation:
    return "RecordValidationError";
  case ErrorKind::kSinkWrite:
    return "SinkWriteError";
  case ErrorKind::kTimeout:
    return "FileTimeoutError";
  case ErrorKind::kIo:
    return "SourceReadError";
  case ErrorKind::kInternal:
    return "InternalError";
  }
  return "UnknownError";
}

CorpusError::CorpusError(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind) {}

ParseError::ParseError(std::string path, std::size_t line, std::size_t column,
                       const std::string &detail)
    : CorpusError(ErrorKind::kParse, path + ":" + std::to_string(line) + ":" +
                                         std::to_string(column) + ": " +
                                         detail),
      path_(std::move(path)), line_(line), column_(column), detail_(detail) {}

NonContiguousClauseError::NonContiguousClauseError(std::string function,
                                                   std::size_t arity,
                                                   std::size_t first_line,
                                                   std::size_t repeat_line)
    : CorpusError(ErrorKind::kNonContiguousClause,
                  "clauses of " + function + "/" + std::to_string(arity) +
                      " first defined at line " + std::to_string(first_line) +
                      " reappear at line " + std::to_string(repeat_line) +
                      " after another function"),
      function_(std::move(function)), arity_(arity), first_line_(first_line),
      repeat_line_(repeat_line) {}

EmptyClauseGroupError::EmptyClauseGroupError(const std::string &group_id)
    : CorpusError(ErrorKind::kEmptyClauseGroup,
                  "clause group " + group_id + " has no clauses") {}

RecordValidationError::RecordValidationError(const std::string &message)
    : CorpusError(ErrorKind::kRecordValidation, message) {}

SinkWriteError::SinkWriteError(const std::string &message)
    : CorpusError(ErrorKind::kSinkWrite, message) {}

FileTimeoutError::FileTimeoutError(const std::string &stage)
    : CorpusError(ErrorKind::kTimeout,
                  "per-file timeout expired during " + stage) {}

NestingDepthError::NestingDepthError(const std::string &group_id,
                                     std::size_t limit)
    : CorpusError(ErrorKind::kParse, "expression nesting in " + group_id +
                                         " exceeds " + std::to_string(limit) +
                                         " levels") {}

SourceReadError::SourceReadError(const std::string &path)
    : CorpusError(ErrorKind::kIo, "Failed to read source file: " + path) {}

std::string ScopeError::Describe() const {
  return "variable '" + variable + "' read in " +
         (in_guard ? std::string("guard") : std::string("body")) +
         " of clause " + std::to_string(clause_index + 1) +
         " before any binding (line " + std::to_string(line) + ", column " +
         std::to_string(column) + ")";
}

} // namespace erlflow
