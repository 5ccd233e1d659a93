#include <erlflow/jsonl_record_sink.h>

#include <erlflow/escaping.h>

#include <filesystem>
#include <sstream>

namespace erlflow {
namespace {

std::string EdgeArray(const std::vector<TokenEdge> &edges) {
  std::ostringstream output;
  output << "[";
  for (std::size_t i = 0; i < edges.size(); ++i) {
    if (i > 0) {
      output << ",";
    }
    output << "[" << edges[i].first << "," << edges[i].second << "]";
  }
  output << "]";
  return output.str();
}

} // namespace

std::string SerializeRecord(const TrainingRecord &record) {
  std::ostringstream output;
  output << "{\"idx\":" << JsonString(record.idx)
         << ",\"url\":" << JsonString(record.url)
         << ",\"docstring\":" << JsonString(record.docstring)
         << ",\"code\":" << JsonString(record.code)
         << ",\"code_tokens\":" << JsonStringArray(record.code_tokens)
         << ",\"dfg\":" << EdgeArray(record.dfg);
  if (record.emit_approximate) {
    output << ",\"dfg_approximate\":" << EdgeArray(record.dfg_approximate);
  }
  output << "}";
  return output.str();
}

JsonlRecordSink::JsonlRecordSink(const std::string &path)
    : stream_(&file_), target_(path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code error;
    std::filesystem::create_directories(parent, error);
    if (error) {
      throw SinkWriteError("cannot create output directory " +
                           parent.string() + ": " + error.message());
    }
  }
  file_.open(path, std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file_) {
    throw SinkWriteError("cannot open output file " + path);
  }
}

JsonlRecordSink::JsonlRecordSink(std::ostream &stream)
    : stream_(&stream), target_("<stream>") {}

void JsonlRecordSink::Write(const TrainingRecord &record) {
  (*stream_) << SerializeRecord(record) << '\n';
  if (!(*stream_)) {
    throw SinkWriteError("failed to write record " + record.idx + " to " +
                         target_);
  }
}

void JsonlRecordSink::Flush() {
  stream_->flush();
  if (!(*stream_)) {
    throw SinkWriteError("failed to flush " + target_);
  }
}

} // namespace erlflow
