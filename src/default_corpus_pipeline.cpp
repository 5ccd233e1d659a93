#include <erlflow/default_corpus_pipeline.h>

#include <erlflow/file_processor.h>
#include <erlflow/run_summary.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace erlflow {
namespace {

constexpr std::size_t kWindowPerWorker = 4;

// Workers claim files in discovery order but may finish out of order; each
// outcome lands in its own slot and the consumer drains slots in order.
// Claims stay within a window ahead of the consumer to bound memory.
class OrderedFileDispatcher {
public:
  OrderedFileDispatcher(const std::vector<SourceCandidate> &files,
                        const FileProcessor &processor,
                        const CorpusConfig &config, std::size_t workers)
      : files_(files), processor_(processor), config_(config),
        slots_(files.size()), window_(std::max<std::size_t>(
                                  1, workers * kWindowPerWorker)) {
    workers_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      workers_.emplace_back(&OrderedFileDispatcher::Work, this);
    }
  }

  ~OrderedFileDispatcher() {
    Stop();
    for (auto &worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  // Blocks until the outcome of file `index` is available.
  FileOutcome Take(std::size_t index) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [&] { return slots_[index].has_value(); });
    auto outcome = std::move(*slots_[index]);
    slots_[index].reset();
    consumed_ = index + 1;
    lock.unlock();
    space_.notify_all();
    return outcome;
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_ = true;
    }
    space_.notify_all();
  }

private:
  void Work() {
    while (true) {
      std::size_t index = 0;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        space_.wait(lock, [this] {
          return stop_ || next_ >= files_.size() ||
                 next_ < consumed_ + window_;
        });
        if (stop_ || next_ >= files_.size()) {
          return;
        }
        index = next_++;
      }

      auto outcome = processor_.Process(files_[index], config_);

      {
        std::lock_guard<std::mutex> lock(mutex_);
        slots_[index] = std::move(outcome);
      }
      ready_.notify_all();
    }
  }

  const std::vector<SourceCandidate> &files_;
  const FileProcessor &processor_;
  const CorpusConfig &config_;
  std::vector<std::optional<FileOutcome>> slots_;
  std::size_t window_;
  std::size_t next_ = 0;
  std::size_t consumed_ = 0;
  bool stop_ = false;
  std::mutex mutex_;
  std::condition_variable ready_;
  std::condition_variable space_;
  std::vector<std::thread> workers_;
};

bool HasIsolatedError(const FileOutcome &outcome) {
  if (outcome.failed) {
    return true;
  }
  return std::any_of(outcome.issues.begin(), outcome.issues.end(),
                     [](const ProcessingIssue &issue) {
                       return issue.kind != ErrorKind::kScope;
                     });
}

} // namespace

DefaultCorpusPipeline::DefaultCorpusPipeline(PipelineComponents components)
    : locator_(std::move(components.locator)),
      parser_(std::move(components.parser)),
      grouper_(std::move(components.grouper)),
      analyzer_(std::move(components.analyzer)),
      documentation_(std::move(components.documentation)),
      assembler_(std::move(components.assembler)),
      sink_(std::move(components.sink)),
      logger_(EnsureLogger(std::move(components.logger))) {}

RunSummary DefaultCorpusPipeline::Run(const CorpusConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"root", config.root_path},
                {"workers", std::to_string(config.workers)},
                {"file_timeout_ms",
                 std::to_string(config.file_timeout.count())}});
  const auto pipeline_start = std::chrono::steady_clock::now();

  const auto discovery = locator_->Locate(config);
  RunSummary summary;
  summary.files_discovered = discovery.files.size();
  summary.files_skipped = discovery.skipped.size();
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "discovery"},
                {"files", std::to_string(discovery.files.size())}});

  const FileProcessor processor(*parser_, *grouper_, *analyzer_,
                                *documentation_, *assembler_, logger_);
  const auto workers = std::min<std::size_t>(
      std::max<std::size_t>(config.workers, 1), discovery.files.size());

  {
    OrderedFileDispatcher dispatcher(discovery.files, processor, config,
                                     workers);
    for (std::size_t index = 0; index < discovery.files.size(); ++index) {
      const auto outcome = dispatcher.Take(index);
      AccumulateOutcome(summary, outcome);
      try {
        for (const auto &record : outcome.records) {
          sink_->Write(record);
          ++summary.records_written;
        }
      } catch (const SinkWriteError &error) {
        AccumulateIssue(summary, {error.Kind(), outcome.path, error.what()});
        summary.aborted = true;
        summary.abort_reason = error.what();
        logger_->Log(LogLevel::kError, "sink.failed",
                     {{"path", outcome.path}, {"message", error.what()}});
        break;
      }
      if (config.fail_fast && HasIsolatedError(outcome)) {
        summary.aborted = true;
        summary.abort_reason = "fail-fast: first error in " + outcome.path;
        logger_->Log(LogLevel::kError, "pipeline.aborted",
                     {{"reason", summary.abort_reason}});
        break;
      }
    }
    dispatcher.Stop();
  }

  try {
    sink_->Flush();
  } catch (const SinkWriteError &error) {
    AccumulateIssue(summary, {error.Kind(), "sink", error.what()});
    summary.aborted = true;
    summary.abort_reason = error.what();
    logger_->Log(LogLevel::kError, "sink.failed", {{"message", error.what()}});
  }

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"files_processed", std::to_string(summary.files_processed)},
                {"files_failed", std::to_string(summary.files_failed)},
                {"records_written", std::to_string(summary.records_written)},
                {"aborted", summary.aborted ? "true" : "false"}});
  return summary;
}

} // namespace erlflow
