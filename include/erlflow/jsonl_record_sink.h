#pragma once

#include <erlflow/interfaces.h>

#include <fstream>
#include <iosfwd>
#include <string>

namespace erlflow {

// One JSON object per line. The dfg_approximate array is written only for
// records assembled with recursive-call edges enabled.
std::string SerializeRecord(const TrainingRecord &record);

class JsonlRecordSink : public RecordSink {
public:
  // Truncates `path`. Throws SinkWriteError when it cannot be opened.
  explicit JsonlRecordSink(const std::string &path);
  explicit JsonlRecordSink(std::ostream &stream);

  void Write(const TrainingRecord &record) override;
  void Flush() override;

private:
  std::ofstream file_;
  std::ostream *stream_;
  std::string target_;
};

} // namespace erlflow
