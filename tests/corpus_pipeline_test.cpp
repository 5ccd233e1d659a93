#include <erlflow/cli_exit_codes.h>
#include <erlflow/corpus_pipeline_builder.h>
#include <erlflow/default_corpus_pipeline.h>
#include <erlflow/erlang_parser.h>
#include <erlflow/erlflow_cli.h>
#include <erlflow/logging.h>

#include "test_support/temporary_project.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace erlflow {
namespace {

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Pair;

std::string ModuleName(std::size_t index) {
  char name[16];
  std::snprintf(name, sizeof(name), "m%03zu", index);
  return name;
}

std::string ModuleSource(const std::string &module) {
  return "-module(" + module + ").\n"
         "-export([add/2, count/1]).\n"
         "add(A, B) -> A + B.\n"
         "count([]) -> 0;\n"
         "count([_ | T]) -> 1 + count(T).\n";
}

// 100 modules under src/, the one at `broken` holding a syntax error.
void PopulateRepository(const test::TemporaryProject &project,
                        std::size_t broken) {
  for (std::size_t i = 0; i < 100; ++i) {
    const auto module = ModuleName(i);
    const auto content = i == broken
                             ? "-module(" + module + ").\nadd(A, B) -> A +.\n"
                             : ModuleSource(module);
    project.AddFile("src/" + module + ".erl", content);
  }
}

CorpusConfig ConfigFor(const test::TemporaryProject &project,
                       std::size_t workers) {
  CorpusConfig config;
  config.root_path = project.root().string();
  config.min_file_size = 1;
  config.workers = workers;
  return config;
}

RunSummary RunInto(const test::TemporaryProject &project,
                   const std::string &output, const CorpusConfig &config) {
  CorpusPipelineBuilder builder;
  builder.WithLogger(std::make_shared<NullLogger>())
      .WithOutputPath((project.root() / output).string());
  auto pipeline = builder.Build();
  return pipeline.Run(config);
}

std::vector<std::string> Lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

class ThrowingSink : public RecordSink {
public:
  void Write(const TrainingRecord &) override {
    throw SinkWriteError("disk full");
  }
  void Flush() override {}
};

// Runs out the budget of the module named "slow" before parsing it.
class StallingParser : public SyntaxParser {
public:
  SyntaxTree Parse(const SourceFile &file,
                   const Deadline &deadline) const override {
    if (file.module == "slow") {
      while (!deadline.Expired()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
      deadline.Check("parse");
    }
    return parser_.Parse(file, deadline);
  }

private:
  ErlangParser parser_;
};

struct LoggedEvent {
  std::string message;
  LogFields fields;
};

// Keeps every event at every level; workers log concurrently.
class RecordingLogger : public Logger {
public:
  void Log(LogLevel, std::string_view message, LogFields fields) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({std::string(message), std::move(fields)});
  }
  LogLevel Level() const override { return LogLevel::kDebug; }

  std::vector<LoggedEvent> Named(const std::string &message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LoggedEvent> matching;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(matching),
                 [&](const LoggedEvent &event) {
                   return event.message == message;
                 });
    return matching;
  }

private:
  mutable std::mutex mutex_;
  std::vector<LoggedEvent> events_;
};

TEST(CorpusPipelineTest, IsolatesMalformedFileAndKeepsTheRest) {
  test::TemporaryProject project;
  PopulateRepository(project, 42);

  const auto summary = RunInto(project, "out/corpus.jsonl", ConfigFor(project, 4));

  EXPECT_EQ(summary.files_discovered, 100u);
  EXPECT_EQ(summary.files_processed, 99u);
  EXPECT_EQ(summary.files_failed, 1u);
  EXPECT_EQ(summary.records_written, 99u * 2u);
  EXPECT_FALSE(summary.aborted);
  ASSERT_EQ(summary.errors.count(ErrorKind::kParse), 1u);
  EXPECT_EQ(summary.errors.at(ErrorKind::kParse).count, 1u);
  EXPECT_THAT(summary.errors.at(ErrorKind::kParse).samples.front(),
              HasSubstr("src/m042.erl:2"));
  EXPECT_EQ(RunExitCode(summary), kExitIsolatedErrors);

  const auto lines = Lines(project.ReadFile("out/corpus.jsonl"));
  ASSERT_EQ(lines.size(), 198u);
  EXPECT_THAT(lines.front(), HasSubstr("\"idx\":\"src/m000.erl:add/2\""));
  EXPECT_THAT(lines[1], HasSubstr("\"idx\":\"src/m000.erl:count/1\""));
  EXPECT_THAT(lines.back(), HasSubstr("\"idx\":\"src/m099.erl:count/1\""));
  for (const auto &line : lines) {
    EXPECT_THAT(line, ::testing::Not(HasSubstr("src/m042.erl")));
  }
}

TEST(CorpusPipelineTest, OutputIsIndependentOfWorkerCount) {
  test::TemporaryProject project;
  PopulateRepository(project, 7);

  RunInto(project, "serial.jsonl", ConfigFor(project, 1));
  RunInto(project, "parallel.jsonl", ConfigFor(project, 8));
  RunInto(project, "again.jsonl", ConfigFor(project, 8));

  const auto serial = project.ReadFile("serial.jsonl");
  EXPECT_FALSE(serial.empty());
  EXPECT_EQ(serial, project.ReadFile("parallel.jsonl"));
  EXPECT_EQ(serial, project.ReadFile("again.jsonl"));
}

TEST(CorpusPipelineTest, FailFastStopsAtFirstFailedFile) {
  test::TemporaryProject project;
  PopulateRepository(project, 3);

  auto config = ConfigFor(project, 2);
  config.fail_fast = true;
  const auto summary = RunInto(project, "corpus.jsonl", config);

  EXPECT_TRUE(summary.aborted);
  EXPECT_THAT(summary.abort_reason, HasSubstr("src/m003.erl"));
  EXPECT_EQ(summary.files_failed, 1u);
  EXPECT_EQ(summary.records_written, 3u * 2u);
  EXPECT_EQ(RunExitCode(summary), kExitFatal);
  EXPECT_EQ(Lines(project.ReadFile("corpus.jsonl")).size(), 6u);
}

TEST(CorpusPipelineTest, SinkFailureAbortsTheRun) {
  test::TemporaryProject project;
  PopulateRepository(project, 100);

  CorpusPipelineBuilder builder;
  builder.WithLogger(std::make_shared<NullLogger>())
      .WithSink(std::make_unique<ThrowingSink>());
  auto pipeline = builder.Build();
  const auto summary = pipeline.Run(ConfigFor(project, 4));

  EXPECT_TRUE(summary.aborted);
  EXPECT_THAT(summary.abort_reason, HasSubstr("disk full"));
  EXPECT_EQ(summary.records_written, 0u);
  EXPECT_EQ(RunExitCode(summary), kExitFatal);
}

TEST(CorpusPipelineTest, ExcessiveNestingFailsOnlyThatFile) {
  test::TemporaryProject project;
  project.AddFile("src/deep.erl", "-module(deep).\nf() -> " +
                                      std::string(20000, '[') + "1" +
                                      std::string(20000, ']') + ".\n");
  project.AddFile("src/good.erl", ModuleSource("good"));

  const auto summary = RunInto(project, "corpus.jsonl", ConfigFor(project, 2));

  EXPECT_EQ(summary.files_failed, 1u);
  EXPECT_EQ(summary.files_processed, 1u);
  ASSERT_EQ(summary.errors.count(ErrorKind::kParse), 1u);
  EXPECT_EQ(summary.errors.at(ErrorKind::kParse).count, 1u);
  EXPECT_THAT(summary.errors.at(ErrorKind::kParse).samples.front(),
              HasSubstr("src/deep.erl:2"));
  EXPECT_EQ(summary.records_written, 2u);
  EXPECT_EQ(RunExitCode(summary), kExitIsolatedErrors);

  const auto lines = Lines(project.ReadFile("corpus.jsonl"));
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_THAT(lines.front(), HasSubstr("\"idx\":\"src/good.erl:add/2\""));
}

TEST(CorpusPipelineTest, TimedOutFileIsRecordedAndSiblingsStillEmit) {
  test::TemporaryProject project;
  project.AddFile("src/alpha.erl", ModuleSource("alpha"));
  project.AddFile("src/slow.erl", ModuleSource("slow"));
  project.AddFile("src/zeta.erl", ModuleSource("zeta"));

  auto config = ConfigFor(project, 3);
  config.file_timeout = std::chrono::milliseconds(200);
  CorpusPipelineBuilder builder;
  builder.WithLogger(std::make_shared<NullLogger>())
      .WithParser(std::make_unique<StallingParser>())
      .WithOutputPath((project.root() / "corpus.jsonl").string());
  auto pipeline = builder.Build();
  const auto summary = pipeline.Run(config);

  EXPECT_FALSE(summary.aborted);
  EXPECT_EQ(summary.files_failed, 1u);
  EXPECT_EQ(summary.files_processed, 2u);
  ASSERT_EQ(summary.errors.count(ErrorKind::kTimeout), 1u);
  EXPECT_THAT(summary.errors.at(ErrorKind::kTimeout).samples.front(),
              HasSubstr("src/slow.erl"));
  EXPECT_EQ(RunExitCode(summary), kExitIsolatedErrors);

  const auto lines = Lines(project.ReadFile("corpus.jsonl"));
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_THAT(lines[0], HasSubstr("\"idx\":\"src/alpha.erl:add/2\""));
  EXPECT_THAT(lines[2], HasSubstr("\"idx\":\"src/zeta.erl:add/2\""));
  for (const auto &line : lines) {
    EXPECT_THAT(line, ::testing::Not(HasSubstr("src/slow.erl")));
  }
}

TEST(CorpusPipelineTest, FailFastStopsAtNonContiguousClauses) {
  test::TemporaryProject project;
  for (std::size_t i = 0; i < 10; ++i) {
    const auto module = ModuleName(i);
    project.AddFile("src/" + module + ".erl",
                    i == 2 ? "-module(" + module + ").\n"
                             "f(1) -> a.\n"
                             "g() -> b.\n"
                             "f(2) -> c.\n"
                           : ModuleSource(module));
  }

  auto config = ConfigFor(project, 4);
  config.fail_fast = true;
  const auto summary = RunInto(project, "corpus.jsonl", config);

  EXPECT_TRUE(summary.aborted);
  EXPECT_THAT(summary.abort_reason, HasSubstr("src/m002.erl"));
  EXPECT_EQ(summary.files_failed, 0u);
  ASSERT_EQ(summary.errors.count(ErrorKind::kNonContiguousClause), 1u);
  EXPECT_THAT(summary.errors.at(ErrorKind::kNonContiguousClause).samples.front(),
              HasSubstr("src/m002.erl:4"));
  EXPECT_EQ(summary.records_written, 2u * 2u + 1u);
  EXPECT_EQ(RunExitCode(summary), kExitFatal);

  const auto lines = Lines(project.ReadFile("corpus.jsonl"));
  ASSERT_EQ(lines.size(), 5u);
  EXPECT_THAT(lines.back(), HasSubstr("\"idx\":\"src/m002.erl:g/0\""));
}

TEST(CorpusPipelineTest, BuilderLoggerReceivesRunAndGroupEvents) {
  test::TemporaryProject project;
  project.AddFile("src/ping.erl",
                  "-module(ping).\n"
                  "ping(X) -> self() ! {hello, X}, receive {hello, N} -> N end.\n");

  const auto logger = std::make_shared<RecordingLogger>();
  CorpusPipelineBuilder builder;
  builder.WithLogger(logger).WithOutputPath(
      (project.root() / "corpus.jsonl").string());
  auto pipeline = builder.Build();
  const auto summary = pipeline.Run(ConfigFor(project, 1));

  EXPECT_EQ(summary.records_written, 1u);
  EXPECT_EQ(logger->Named("pipeline.start").size(), 1u);
  EXPECT_EQ(logger->Named("discovery.complete").size(), 1u);
  EXPECT_EQ(logger->Named("pipeline.complete").size(), 1u);

  const auto analyzed = logger->Named("group.analyzed");
  ASSERT_EQ(analyzed.size(), 1u);
  const auto &fields = analyzed.front().fields;
  EXPECT_THAT(fields, Contains(Pair("group", "ping:ping/1")));
  EXPECT_THAT(fields, Contains(Pair("edges.message", "1")));
  EXPECT_THAT(fields, Contains(Pair("roles.sent-in-message", "1")));
  EXPECT_THAT(fields, Contains(Pair("roles.match-input", "1")));
}

TEST(CorpusPipelineTest, EmptyRepositoryProducesEmptyCorpus) {
  test::TemporaryProject project;
  project.AddFile("README.md", "nothing to see");

  const auto summary = RunInto(project, "corpus.jsonl", ConfigFor(project, 4));

  EXPECT_EQ(summary.files_discovered, 0u);
  EXPECT_EQ(summary.records_written, 0u);
  EXPECT_EQ(RunExitCode(summary), kExitClean);
  EXPECT_EQ(project.ReadFile("corpus.jsonl"), "");
}

TEST(RunExtractTest, WritesCorpusAndSummaryFromTheCommandLine) {
  test::TemporaryProject project;
  PopulateRepository(project, 100);
  const auto output = project.root() / "out" / "corpus.jsonl";
  const auto summary_path = project.root() / "out" / "summary.json";

  const int exit_code = RunExtract(
      {"--root", (project.root() / "src").string(), "--out", output.string(),
       "--min-file-size", "1", "--workers", "3", "--summary",
       summary_path.string(), "--log-level", "error"});

  EXPECT_EQ(exit_code, kExitClean);
  EXPECT_EQ(Lines(project.ReadFile("out/corpus.jsonl")).size(), 200u);
  EXPECT_THAT(project.ReadFile("out/summary.json"),
              HasSubstr("\"records_written\": 200"));
}

TEST(RunExtractTest, ReportsIsolatedErrorsThroughExitCode) {
  test::TemporaryProject project;
  PopulateRepository(project, 0);
  const auto output = project.root() / "corpus.jsonl";

  const int exit_code =
      RunExtract({"--root", project.root().string(), "--out", output.string(),
                  "--min-file-size", "1", "--log-level", "error"});

  EXPECT_EQ(exit_code, kExitIsolatedErrors);
}

} // namespace
} // namespace erlflow
