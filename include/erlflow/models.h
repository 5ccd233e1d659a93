#pragma once

#include <erlflow/errors.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace erlflow {

struct FlowOptions {
  bool include_recursive_edges = true;
};

struct CorpusConfig {
  std::string root_path;
  std::string output_path;
  std::string source_url;
  std::vector<std::string> extensions = {".erl"};
  std::vector<std::string> excluded_directories = {"deps", "_build", "ebin",
                                                   "priv", ".git"};
  std::vector<std::string> ignored_paths;
  std::uintmax_t min_file_size = 50;
  std::uintmax_t max_file_size = 1024 * 1024;
  std::size_t workers = 8;
  std::chrono::milliseconds file_timeout{30000};
  std::size_t min_function_lines = 1;
  std::size_t max_function_lines = 200;
  FlowOptions flow;
  bool fail_fast = false;
};

struct SourceCandidate {
  std::string path;
  std::string relative_path;
  std::uintmax_t size = 0;
};

struct SkippedFile {
  std::string path;
  std::string reason;
};

struct SourceDiscoveryResult {
  std::string root;
  std::vector<SourceCandidate> files;
  std::vector<SkippedFile> skipped;
};

struct SourceFile {
  std::string path;
  std::string relative_path;
  std::string content;
  std::string module;
};

using TokenEdge = std::pair<std::size_t, std::size_t>;

struct TrainingRecord {
  std::string idx;
  std::string url;
  std::string docstring;
  std::string code;
  std::vector<std::string> code_tokens;
  std::vector<TokenEdge> dfg;
  // Heuristic recursive-call edges, kept apart from the exact ones.
  std::vector<TokenEdge> dfg_approximate;
  bool emit_approximate = false;
};

struct ProcessingIssue {
  ErrorKind kind = ErrorKind::kInternal;
  std::string location;
  std::string message;
};

struct FileOutcome {
  std::string path;
  bool failed = false;
  std::vector<TrainingRecord> records;
  std::vector<ProcessingIssue> issues;
  std::size_t groups_filtered = 0;
};

struct ErrorTally {
  std::size_t count = 0;
  std::vector<std::string> samples;
};

struct RunSummary {
  std::size_t files_discovered = 0;
  std::size_t files_processed = 0;
  std::size_t files_failed = 0;
  std::size_t files_skipped = 0;
  std::size_t groups_filtered = 0;
  std::size_t records_written = 0;
  std::map<ErrorKind, ErrorTally> errors;
  bool aborted = false;
  std::string abort_reason;
};

} // namespace erlflow
