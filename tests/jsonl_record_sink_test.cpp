#include <erlflow/jsonl_record_sink.h>

#include "test_support/temporary_project.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>

namespace erlflow {
namespace {

TrainingRecord SampleRecord() {
  TrainingRecord record;
  record.idx = "src/calc.erl:id/1";
  record.url = "src/calc.erl#L2-L2";
  record.docstring = "Says \"hi\".";
  record.code = "id(X) ->\n  X.";
  record.code_tokens = {"id", "(", "X", ")", "->", "X", "."};
  record.dfg = {{2, 5}};
  return record;
}

TEST(JsonlRecordSinkTest, SerializesSchemaFieldsInOrder) {
  EXPECT_EQ(SerializeRecord(SampleRecord()),
            "{\"idx\":\"src/calc.erl:id/1\","
            "\"url\":\"src/calc.erl#L2-L2\","
            "\"docstring\":\"Says \\\"hi\\\".\","
            "\"code\":\"id(X) ->\\n  X.\","
            "\"code_tokens\":[\"id\",\"(\",\"X\",\")\",\"->\",\"X\",\".\"],"
            "\"dfg\":[[2,5]]}");
}

TEST(JsonlRecordSinkTest, AppendsApproximateEdgesOnlyWhenRequested) {
  auto record = SampleRecord();
  record.emit_approximate = true;

  const auto empty = SerializeRecord(record);
  EXPECT_NE(empty.find(",\"dfg_approximate\":[]}"), std::string::npos);

  record.dfg_approximate = {{5, 2}, {5, 0}};
  const auto filled = SerializeRecord(record);
  EXPECT_NE(filled.find(",\"dfg_approximate\":[[5,2],[5,0]]}"),
            std::string::npos);
}

TEST(JsonlRecordSinkTest, WritesOneLinePerRecord) {
  std::ostringstream stream;
  JsonlRecordSink sink(stream);

  sink.Write(SampleRecord());
  sink.Write(SampleRecord());
  sink.Flush();

  const auto output = stream.str();
  EXPECT_EQ(std::count(output.begin(), output.end(), '\n'), 2);
  EXPECT_EQ(output.back(), '\n');
}

TEST(JsonlRecordSinkTest, CreatesParentDirectoriesAndTruncates) {
  test::TemporaryProject project("erlflow-sink");
  const auto path = project.root() / "out" / "nested" / "corpus.jsonl";
  project.AddFile("out/nested/corpus.jsonl", "stale\n");

  {
    JsonlRecordSink sink(path.string());
    sink.Write(SampleRecord());
    sink.Flush();
  }

  EXPECT_EQ(project.ReadFile("out/nested/corpus.jsonl"),
            SerializeRecord(SampleRecord()) + "\n");
}

TEST(JsonlRecordSinkTest, FailsWhenTargetCannotBeOpened) {
  test::TemporaryProject project("erlflow-sink");
  std::filesystem::create_directories(project.root() / "taken");

  EXPECT_THROW(JsonlRecordSink((project.root() / "taken").string()),
               SinkWriteError);
}

TEST(JsonlRecordSinkTest, ReportsWriteFailureOnBrokenStream) {
  std::ostringstream stream;
  stream.setstate(std::ios::badbit);
  JsonlRecordSink sink(stream);

  EXPECT_THROW(sink.Write(SampleRecord()), SinkWriteError);
}

} // namespace
} // namespace erlflow
