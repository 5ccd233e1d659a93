#pragma once

#include <erlflow/logging.h>
#include <erlflow/models.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace erlflow {

struct ExtractOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> output;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> summary_file;
  std::optional<std::filesystem::path> log_file;
  std::optional<std::string> source_url;
  std::optional<std::string> documentation;
  std::optional<std::string> emitter;
  std::vector<std::string> extensions;
  std::vector<std::string> ignored_paths;
  std::optional<std::uintmax_t> max_file_size;
  std::optional<std::uintmax_t> min_file_size;
  std::optional<std::size_t> workers;
  std::optional<std::uintmax_t> file_timeout_ms;
  std::optional<std::size_t> min_function_lines;
  std::optional<std::size_t> max_function_lines;
  std::optional<bool> recursive_edges;
  std::optional<bool> fail_fast;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct InspectOptions {
  std::optional<std::filesystem::path> file;
  std::optional<std::string> documentation;
  std::optional<std::string> source_url;
  std::optional<bool> recursive_edges;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

ExtractOptions ParseExtractArguments(const std::vector<std::string> &arguments);
ExtractOptions ParseConfigFile(const std::filesystem::path &path);
ExtractOptions MergeOptions(const ExtractOptions &config_options,
                            const ExtractOptions &cli_options);
// Loads --config when given, applies command-line overrides and validates
// the result. Throws std::invalid_argument on missing or inconsistent values.
ExtractOptions ResolveExtractOptions(const ExtractOptions &cli_options);
CorpusConfig BuildCorpusConfig(const ExtractOptions &options);
// Warn unless a level was given.
LoggingConfig BuildLoggingConfig(std::optional<LogLevel> level);

InspectOptions ParseInspectArguments(const std::vector<std::string> &arguments);

int RunExtract(const std::vector<std::string> &arguments);
int RunInspect(const std::vector<std::string> &arguments);

} // namespace erlflow
