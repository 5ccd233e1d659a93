#include <erlflow/erlang_source_locator.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace erlflow {

namespace {
bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }
  return std::distance(potential_parent.begin(), potential_parent.end()) <=
             std::distance(candidate.begin(), candidate.end()) &&
         std::equal(potential_parent.begin(), potential_parent.end(),
                    candidate.begin());
}

bool IsIgnoredPath(const std::filesystem::path &path,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  return std::any_of(
      ignored_paths.begin(), ignored_paths.end(),
      [&](const auto &ignored) { return IsWithin(path, ignored); });
}

bool HasSourceExtension(const std::filesystem::path &path,
                        const std::vector<std::string> &extensions) {
  const auto extension = path.extension().string();
  return std::find(extensions.begin(), extensions.end(), extension) !=
         extensions.end();
}

bool IsExcludedDirectory(const std::filesystem::path &path,
                         const std::vector<std::string> &excluded) {
  const auto name = path.filename().string();
  return std::find(excluded.begin(), excluded.end(), name) != excluded.end();
}

std::filesystem::path ResolveRootPath(const CorpusConfig &config) {
  if (config.root_path.empty()) {
    throw std::invalid_argument("CorpusConfig.root_path must not be empty.");
  }

  const auto normalized_root =
      std::filesystem::weakly_canonical(config.root_path);

  if (!std::filesystem::exists(normalized_root) ||
      !std::filesystem::is_directory(normalized_root)) {
    throw std::runtime_error("Corpus root path is not a directory: " +
                             normalized_root.string());
  }

  return normalized_root;
}

std::vector<std::filesystem::path>
ResolveIgnoredPaths(const std::filesystem::path &root,
                    const std::vector<std::string> &configured) {
  std::vector<std::filesystem::path> ignored;
  ignored.reserve(configured.size());
  for (const auto &entry : configured) {
    std::filesystem::path path(entry);
    if (!path.is_absolute()) {
      path = root / path;
    }
    ignored.push_back(std::filesystem::weakly_canonical(path));
  }
  return ignored;
}
} // namespace

ErlangSourceLocator::ErlangSourceLocator(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

SourceDiscoveryResult ErlangSourceLocator::Locate(const CorpusConfig &config) {
  const auto root = ResolveRootPath(config);
  const auto ignored_paths = ResolveIgnoredPaths(root, config.ignored_paths);

  SourceDiscoveryResult result;
  result.root = root.string();

  const auto options =
      std::filesystem::directory_options::skip_permission_denied;
  for (std::filesystem::recursive_directory_iterator it(root, options), end;
       it != end; ++it) {
    const auto &entry = *it;
    const auto &path = entry.path();
    std::error_code error;
    if (entry.is_directory(error)) {
      if (IsExcludedDirectory(path, config.excluded_directories) ||
          IsIgnoredPath(path, ignored_paths)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(error) ||
        !HasSourceExtension(path, config.extensions) ||
        IsIgnoredPath(path, ignored_paths)) {
      continue;
    }

    const auto relative = path.lexically_relative(root).generic_string();
    const auto size = entry.file_size(error);
    if (error) {
      result.skipped.push_back({relative, "unreadable: " + error.message()});
      logger_->Log(LogLevel::kWarn, "file.skipped",
                   {{"path", relative}, {"reason", error.message()}});
      continue;
    }
    if (size > config.max_file_size) {
      result.skipped.push_back(
          {relative, "exceeds maximum size (" + std::to_string(size) +
                         " > " + std::to_string(config.max_file_size) +
                         " bytes)"});
      logger_->Log(LogLevel::kWarn, "file.skipped",
                   {{"path", relative},
                    {"reason", "oversized"},
                    {"size", std::to_string(size)}});
      continue;
    }
    if (size < config.min_file_size) {
      result.skipped.push_back(
          {relative, "below minimum size (" + std::to_string(size) + " < " +
                         std::to_string(config.min_file_size) + " bytes)"});
      logger_->Log(LogLevel::kDebug, "file.skipped",
                   {{"path", relative},
                    {"reason", "undersized"},
                    {"size", std::to_string(size)}});
      continue;
    }
    result.files.push_back({path.string(), relative, size});
  }

  std::sort(result.files.begin(), result.files.end(),
            [](const SourceCandidate &left, const SourceCandidate &right) {
              return left.relative_path < right.relative_path;
            });
  std::sort(result.skipped.begin(), result.skipped.end(),
            [](const SkippedFile &left, const SkippedFile &right) {
              return left.path < right.path;
            });

  logger_->Log(LogLevel::kInfo, "discovery.complete",
               {{"root", result.root},
                {"files", std::to_string(result.files.size())},
                {"skipped", std::to_string(result.skipped.size())}});
  return result;
}

} // namespace erlflow
