#include <erlflow/cli_exit_codes.h>
#include <erlflow/component_registry.h>
#include <erlflow/contiguous_clause_grouper.h>
#include <erlflow/corpus_pipeline_builder.h>
#include <erlflow/default_corpus_pipeline.h>
#include <erlflow/erlang_parser.h>
#include <erlflow/erlflow_cli.h>
#include <erlflow/file_processor.h>
#include <erlflow/graph_code_record_assembler.h>
#include <erlflow/jsonl_record_sink.h>
#include <erlflow/run_summary.h>
#include <erlflow/variable_flow_analyzer.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using erlflow::ExtractOptions;
using erlflow::InspectOptions;

void PrintExtractUsage() {
  std::cout
      << "Usage: erlflow extract --root <dir> --out <file.jsonl> [options]\n"
      << "Options:\n"
      << "  --root <dir>              Directory scanned for Erlang sources\n"
      << "  --out <file>              JSONL file receiving the records\n"
      << "  --config <file>           Optional YAML config file\n"
      << "  --extensions <list>       Comma-separated source extensions\n"
      << "                            (default: .erl)\n"
      << "  --ignored-paths <list>    Comma-separated paths relative to "
         "--root\n"
      << "                            to skip during discovery\n"
      << "  --min-file-size <bytes>   Skip smaller files (default: 50)\n"
      << "  --max-file-size <bytes>   Skip larger files (default: 1048576)\n"
      << "  --min-function-lines <n>  Drop shorter functions (default: 1)\n"
      << "  --max-function-lines <n>  Drop longer functions (default: 200)\n"
      << "  --workers <n>             Parallel file workers (default: 8)\n"
      << "  --file-timeout-ms <ms>    Per-file processing budget\n"
      << "                            (default: 30000, 0 disables)\n"
      << "  --recursive-edges         Emit approximate edges for recursive\n"
      << "                            calls and cross-clause messages\n"
      << "                            (default)\n"
      << "  --no-recursive-edges      Omit approximate edges\n"
      << "  --fail-fast               Stop at the first file or group error\n"
      << "  --continue-on-error       Record errors and keep going (default)\n"
      << "  --source-url <base>       Base URL prefixed to record urls\n"
      << "  --docs <provider>         Documentation provider (edoc, none)\n"
      << "  --emitter <name>          Record sink plug-in (jsonl)\n"
      << "  --summary <file>          Write the run summary as JSON\n"
      << "  --log-level <level>       Logging verbosity "
         "(error,warn,info,debug)\n"
      << "  --verbose                 Shortcut for --log-level info\n"
      << "  --debug                   Shortcut for --log-level debug\n"
      << "  --log-file <path>         Append log lines to a file instead of\n"
      << "                            stderr\n"
      << "  --help                    Show this message\n";
}

void PrintInspectUsage() {
  std::cout << "Usage: erlflow inspect <file.erl> [options]\n"
            << "Options:\n"
            << "  --docs <provider>      Documentation provider (edoc, none)\n"
            << "  --source-url <base>    Base URL prefixed to record urls\n"
            << "  --no-recursive-edges   Omit approximate edges\n"
            << "  --log-level <level>    Logging verbosity\n"
            << "  --help                 Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  return normalized == "true" || normalized == "1" || normalized == "yes" ||
         normalized == "on";
}

erlflow::LogLevel ParseLogLevel(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "error") {
    return erlflow::LogLevel::kError;
  }
  if (normalized == "warn" || normalized == "warning") {
    return erlflow::LogLevel::kWarn;
  }
  if (normalized == "info") {
    return erlflow::LogLevel::kInfo;
  }
  if (normalized == "debug") {
    return erlflow::LogLevel::kDebug;
  }
  throw std::invalid_argument("Unknown log level: " + value);
}

std::uintmax_t ParseCount(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
      })) {
    throw std::invalid_argument(name + " expects a non-negative integer, got '" +
                                value + "'");
  }
  try {
    return std::stoull(trimmed);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " is out of range: " + value);
  }
}

std::size_t ParseSize(const std::string &value, const std::string &name) {
  const auto count = ParseCount(value, name);
  if (count > std::numeric_limits<std::size_t>::max()) {
    throw std::invalid_argument(name + " is out of range: " + value);
  }
  return static_cast<std::size_t>(count);
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!current.empty()) {
        values.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(character);
    }
  }
  if (!current.empty()) {
    values.push_back(current);
  }
  return values;
}

void AppendExtensions(const std::string &raw_extensions,
                      std::vector<std::string> &target) {
  for (auto extension : SplitList(raw_extensions)) {
    extension = ToLower(Trim(extension));
    if (extension.empty()) {
      continue;
    }
    if (extension.front() != '.') {
      extension.insert(extension.begin(), '.');
    }
    if (std::find(target.begin(), target.end(), extension) == target.end()) {
      target.push_back(std::move(extension));
    }
  }
}

void AppendIgnoredPaths(const std::string &raw_paths,
                        std::vector<std::string> &target) {
  for (auto path_value : SplitList(raw_paths)) {
    path_value = Trim(path_value);
    if (path_value.empty()) {
      continue;
    }

    const auto normalized = std::filesystem::path(path_value).generic_string();
    if (std::find(target.begin(), target.end(), normalized) == target.end()) {
      target.push_back(normalized);
    }
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index,
                         std::optional<erlflow::LogLevel> &log_level) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    log_level = erlflow::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    log_level = erlflow::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleDiscoveryOption(const std::vector<std::string> &arguments,
                           std::size_t &index, ExtractOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--extensions") {
    AppendExtensions(RequireValue(arguments, index, argument),
                     options.extensions);
    return true;
  }
  if (argument == "--ignored-paths") {
    AppendIgnoredPaths(RequireValue(arguments, index, argument),
                       options.ignored_paths);
    return true;
  }
  if (argument == "--min-file-size") {
    options.min_file_size =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--max-file-size") {
    options.max_file_size =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool HandleProcessingOption(const std::vector<std::string> &arguments,
                            std::size_t &index, ExtractOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--workers") {
    options.workers =
        ParseSize(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--file-timeout-ms") {
    options.file_timeout_ms =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--min-function-lines") {
    options.min_function_lines =
        ParseSize(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--max-function-lines") {
    options.max_function_lines =
        ParseSize(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--recursive-edges") {
    options.recursive_edges = true;
    return true;
  }
  if (argument == "--no-recursive-edges") {
    options.recursive_edges = false;
    return true;
  }
  if (argument == "--fail-fast") {
    options.fail_fast = true;
    return true;
  }
  if (argument == "--continue-on-error") {
    options.fail_fast = false;
    return true;
  }
  return false;
}

bool HandlePluginSelection(const std::vector<std::string> &arguments,
                           std::size_t &index, ExtractOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--docs") {
    options.documentation = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--emitter") {
    options.emitter = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool DispatchExtractOption(const std::vector<std::string> &arguments,
                           std::size_t &index, ExtractOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, "--root");
    return true;
  }
  if (argument == "--out") {
    options.output = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--summary") {
    options.summary_file = RequireValue(arguments, index, "--summary");
    return true;
  }
  if (argument == "--log-file") {
    options.log_file = RequireValue(arguments, index, "--log-file");
    return true;
  }
  if (argument == "--source-url") {
    options.source_url = RequireValue(arguments, index, "--source-url");
    return true;
  }

  return HandleDiscoveryOption(arguments, index, options) ||
         HandleProcessingOption(arguments, index, options) ||
         HandlePluginSelection(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options.log_level);
}

void ValidateExtractOptions(const ExtractOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
  if (!options.output) {
    throw std::invalid_argument("--out is required (or set in config file)");
  }
  if (options.workers && *options.workers == 0) {
    throw std::invalid_argument("--workers must be at least 1");
  }
  if (options.min_file_size && options.max_file_size &&
      *options.min_file_size > *options.max_file_size) {
    throw std::invalid_argument(
        "--min-file-size must not exceed --max-file-size");
  }
  const auto min_lines = options.min_function_lines.value_or(1);
  const auto max_lines = options.max_function_lines.value_or(200);
  if (min_lines > max_lines) {
    throw std::invalid_argument(
        "--min-function-lines must not exceed --max-function-lines");
  }
}

} // namespace

namespace erlflow {

ExtractOptions ParseExtractArguments(const std::vector<std::string> &arguments) {
  ExtractOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchExtractOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

InspectOptions ParseInspectArguments(const std::vector<std::string> &arguments) {
  InspectOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--docs") {
      options.documentation = RequireValue(arguments, i, argument);
      continue;
    }
    if (argument == "--source-url") {
      options.source_url = RequireValue(arguments, i, argument);
      continue;
    }
    if (argument == "--recursive-edges") {
      options.recursive_edges = true;
      continue;
    }
    if (argument == "--no-recursive-edges") {
      options.recursive_edges = false;
      continue;
    }
    if (HandleLoggingOption(arguments, i, options.log_level)) {
      continue;
    }
    if (argument.rfind('-', 0) != 0 && !options.file) {
      options.file = argument;
      continue;
    }
    throw std::invalid_argument("Unknown inspect argument: " + argument);
  }
  return options;
}

using ConfigValue = std::variant<std::string, bool, std::vector<std::string>>;
using RawConfig = std::unordered_map<std::string, ConfigValue>;

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"root",
                                                "out",
                                                "extensions",
                                                "ignored_paths",
                                                "min_file_size",
                                                "max_file_size",
                                                "min_function_lines",
                                                "max_function_lines",
                                                "workers",
                                                "file_timeout_ms",
                                                "recursive_edges",
                                                "fail_fast",
                                                "source_url",
                                                "docs",
                                                "emitter",
                                                "summary",
                                                "log_level",
                                                "log_file"};
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_file", "out"},
      {"extension", "extensions"},
      {"documentation", "docs"},
      {"timeout_ms", "file_timeout_ms"},
      {"summary_file", "summary"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  const auto found = std::find(supported.begin(), supported.end(), normalized);
  if (found == supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a boolean or boolean-like string");
  }
  return ParseBool(node.as<std::string>());
}

ConfigValue ToConfigValue(const std::string &key, const YAML::Node &node) {
  if (key == "extensions") {
    return ExtractList(node, key, AppendExtensions);
  }
  if (key == "ignored_paths") {
    return ExtractList(node, key, AppendIgnoredPaths);
  }
  if (key == "recursive_edges" || key == "fail_fast") {
    return ConfigValue{ExtractBool(node, key)};
  }
  return ConfigValue{ExtractStringScalar(node, key)};
}

RawConfig ParseYamlConfig(const std::filesystem::path &path) {
  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  RawConfig config;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    config[key] = ToConfigValue(key, entry.second);
  }
  return config;
}

void ApplyConfig(const RawConfig &config, ExtractOptions &options) {
  for (const auto &[key, value] : config) {
    const auto text = [&]() { return std::get<std::string>(value); };
    if (key == "root") {
      options.root = text();
    } else if (key == "out") {
      options.output = text();
    } else if (key == "summary") {
      options.summary_file = text();
    } else if (key == "log_file") {
      options.log_file = text();
    } else if (key == "source_url") {
      options.source_url = text();
    } else if (key == "docs") {
      options.documentation = text();
    } else if (key == "emitter") {
      options.emitter = text();
    } else if (key == "log_level") {
      options.log_level = ParseLogLevel(text());
    } else if (key == "extensions") {
      options.extensions = std::get<std::vector<std::string>>(value);
    } else if (key == "ignored_paths") {
      options.ignored_paths = std::get<std::vector<std::string>>(value);
    } else if (key == "min_file_size") {
      options.min_file_size = ParseCount(text(), key);
    } else if (key == "max_file_size") {
      options.max_file_size = ParseCount(text(), key);
    } else if (key == "min_function_lines") {
      options.min_function_lines = ParseSize(text(), key);
    } else if (key == "max_function_lines") {
      options.max_function_lines = ParseSize(text(), key);
    } else if (key == "workers") {
      options.workers = ParseSize(text(), key);
    } else if (key == "file_timeout_ms") {
      options.file_timeout_ms = ParseCount(text(), key);
    } else if (key == "recursive_edges") {
      options.recursive_edges = std::get<bool>(value);
    } else if (key == "fail_fast") {
      options.fail_fast = std::get<bool>(value);
    } else {
      ThrowUnknownKey(key);
    }
  }
}

ExtractOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  ExtractOptions options;
  options.config_file = path;
  RawConfig config = ParseYamlConfig(path);
  ApplyConfig(config, options);

  return options;
}

ExtractOptions MergeOptions(const ExtractOptions &config_options,
                            const ExtractOptions &cli_options) {
  ExtractOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.output, cli_options.output);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.summary_file, cli_options.summary_file);
  override_value(merged.log_file, cli_options.log_file);
  override_value(merged.source_url, cli_options.source_url);
  override_value(merged.documentation, cli_options.documentation);
  override_value(merged.emitter, cli_options.emitter);
  override_value(merged.max_file_size, cli_options.max_file_size);
  override_value(merged.min_file_size, cli_options.min_file_size);
  override_value(merged.workers, cli_options.workers);
  override_value(merged.file_timeout_ms, cli_options.file_timeout_ms);
  override_value(merged.min_function_lines, cli_options.min_function_lines);
  override_value(merged.max_function_lines, cli_options.max_function_lines);
  override_value(merged.recursive_edges, cli_options.recursive_edges);
  override_value(merged.fail_fast, cli_options.fail_fast);
  override_value(merged.log_level, cli_options.log_level);

  if (!cli_options.extensions.empty()) {
    merged.extensions = cli_options.extensions;
  }
  if (!cli_options.ignored_paths.empty()) {
    merged.ignored_paths = cli_options.ignored_paths;
  }
  return merged;
}

ExtractOptions ResolveExtractOptions(const ExtractOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  ExtractOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateExtractOptions(merged);
  return merged;
}

LoggingConfig BuildLoggingConfig(std::optional<LogLevel> level) {
  LoggingConfig logging;
  logging.level = level.value_or(LogLevel::kWarn);
  return logging;
}

CorpusConfig BuildCorpusConfig(const ExtractOptions &options) {
  CorpusConfig config;
  if (options.root) {
    config.root_path = options.root->string();
  }
  if (options.output) {
    config.output_path = options.output->string();
  }
  config.source_url = options.source_url.value_or("");
  if (!options.extensions.empty()) {
    config.extensions = options.extensions;
  }
  config.ignored_paths = options.ignored_paths;
  config.min_file_size = options.min_file_size.value_or(config.min_file_size);
  config.max_file_size = options.max_file_size.value_or(config.max_file_size);
  config.workers = options.workers.value_or(config.workers);
  if (options.file_timeout_ms) {
    config.file_timeout = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(*options.file_timeout_ms));
  }
  config.min_function_lines =
      options.min_function_lines.value_or(config.min_function_lines);
  config.max_function_lines =
      options.max_function_lines.value_or(config.max_function_lines);
  config.flow.include_recursive_edges = options.recursive_edges.value_or(true);
  config.fail_fast = options.fail_fast.value_or(false);
  return config;
}

DefaultCorpusPipeline
BuildExtractPipeline(const ExtractOptions &options,
                     const std::shared_ptr<Logger> &logger) {
  CorpusPipelineBuilder builder;
  builder.WithLogger(logger);
  if (options.documentation) {
    builder.WithDocumentationProviderName(*options.documentation);
  }
  if (options.emitter) {
    builder.WithSinkName(*options.emitter);
  }
  builder.WithOutputPath(options.output->string());
  return builder.Build();
}

int RunExtract(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseExtractArguments(arguments);
  if (cli_options.show_help) {
    PrintExtractUsage();
    return kExitClean;
  }

  const auto merged = ResolveExtractOptions(cli_options);
  std::ofstream log_stream;
  if (merged.log_file) {
    log_stream.open(*merged.log_file, std::ios::out | std::ios::app);
    if (!log_stream) {
      throw std::runtime_error("Failed to open log file: " +
                               merged.log_file->string());
    }
  }
  auto logger =
      MakeLogger(BuildLoggingConfig(merged.log_level),
                 merged.log_file ? static_cast<std::ostream &>(log_stream)
                                 : std::clog);

  auto pipeline = BuildExtractPipeline(merged, logger);
  const auto config = BuildCorpusConfig(merged);

  const auto summary = pipeline.Run(config);
  std::cout << FormatRunSummary(summary);
  if (merged.summary_file) {
    WriteRunSummary(summary, merged.summary_file->string());
  }
  return RunExitCode(summary);
}

int RunInspect(const std::vector<std::string> &arguments) {
  const auto options = ParseInspectArguments(arguments);
  if (options.show_help) {
    PrintInspectUsage();
    return kExitClean;
  }
  if (!options.file) {
    throw std::invalid_argument("inspect requires a source file");
  }

  const auto path = std::filesystem::weakly_canonical(*options.file);
  std::error_code error;
  const auto size = std::filesystem::file_size(path, error);
  if (error) {
    throw SourceReadError(path.string());
  }

  auto logger = MakeLogger(BuildLoggingConfig(options.log_level), std::clog);
  ExtractOptions extract_options;
  extract_options.source_url = options.source_url;
  extract_options.recursive_edges = options.recursive_edges;
  extract_options.log_level = options.log_level;
  extract_options.max_function_lines = std::numeric_limits<std::size_t>::max();
  auto config = BuildCorpusConfig(extract_options);
  config.root_path = path.parent_path().string();

  const ErlangParser parser;
  const ContiguousClauseGrouper grouper;
  const VariableFlowAnalyzer analyzer;
  const GraphCodeRecordAssembler assembler;
  const auto documentation = GlobalComponentRegistry().CreateDocumentationProvider(
      options.documentation.value_or(""));
  const FileProcessor processor(parser, grouper, analyzer, *documentation,
                                assembler, logger);

  SourceCandidate candidate;
  candidate.path = path.string();
  candidate.relative_path = path.filename().generic_string();
  candidate.size = size;
  const auto outcome = processor.Process(candidate, config);

  JsonlRecordSink sink(std::cout);
  for (const auto &record : outcome.records) {
    sink.Write(record);
  }
  sink.Flush();

  for (const auto &issue : outcome.issues) {
    std::cerr << ErrorKindName(issue.kind) << " " << issue.location << ": "
              << issue.message << "\n";
  }

  RunSummary summary;
  summary.files_discovered = 1;
  AccumulateOutcome(summary, outcome);
  summary.records_written = outcome.records.size();
  return RunExitCode(summary);
}

} // namespace erlflow
