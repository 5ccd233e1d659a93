#include <erlflow/run_summary.h>

#include <erlflow/escaping.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace erlflow {

void AccumulateIssue(RunSummary &summary, const ProcessingIssue &issue) {
  auto &tally = summary.errors[issue.kind];
  ++tally.count;
  if (tally.samples.size() < kMaxErrorSamples) {
    tally.samples.push_back(issue.location + ": " + issue.message);
  }
}

void AccumulateOutcome(RunSummary &summary, const FileOutcome &outcome) {
  if (outcome.failed) {
    ++summary.files_failed;
  } else {
    ++summary.files_processed;
  }
  summary.groups_filtered += outcome.groups_filtered;
  for (const auto &issue : outcome.issues) {
    AccumulateIssue(summary, issue);
  }
}

std::string FormatRunSummary(const RunSummary &summary) {
  std::ostringstream output;
  output << "Run summary\n";
  output << "  files discovered: " << summary.files_discovered << "\n";
  output << "  files processed:  " << summary.files_processed << "\n";
  output << "  files failed:     " << summary.files_failed << "\n";
  output << "  files skipped:    " << summary.files_skipped << "\n";
  output << "  groups filtered:  " << summary.groups_filtered << "\n";
  output << "  records written:  " << summary.records_written << "\n";
  if (summary.errors.empty()) {
    output << "  errors: none\n";
  } else {
    output << "  errors:\n";
    for (const auto &[kind, tally] : summary.errors) {
      output << "    " << ErrorKindName(kind) << ": " << tally.count << "\n";
      for (const auto &sample : tally.samples) {
        output << "      - " << sample << "\n";
      }
    }
  }
  if (summary.aborted) {
    output << "  aborted: " << summary.abort_reason << "\n";
  }
  return output.str();
}

std::string RunSummaryToJson(const RunSummary &summary) {
  std::ostringstream output;
  output << "{\n";
  output << "  \"files_discovered\": " << summary.files_discovered << ",\n";
  output << "  \"files_processed\": " << summary.files_processed << ",\n";
  output << "  \"files_failed\": " << summary.files_failed << ",\n";
  output << "  \"files_skipped\": " << summary.files_skipped << ",\n";
  output << "  \"groups_filtered\": " << summary.groups_filtered << ",\n";
  output << "  \"records_written\": " << summary.records_written << ",\n";
  output << "  \"aborted\": " << (summary.aborted ? "true" : "false") << ",\n";
  output << "  \"abort_reason\": " << JsonString(summary.abort_reason)
         << ",\n";
  output << "  \"errors\": {";
  bool first = true;
  for (const auto &[kind, tally] : summary.errors) {
    output << (first ? "\n" : ",\n");
    first = false;
    output << "    " << JsonString(ErrorKindName(kind))
           << ": {\"count\": " << tally.count
           << ", \"samples\": " << JsonStringArray(tally.samples) << "}";
  }
  output << (first ? "}\n" : "\n  }\n");
  output << "}\n";
  return output.str();
}

void WriteRunSummary(const RunSummary &summary, const std::string &path) {
  std::ofstream output(path, std::ios::out | std::ios::trunc);
  if (!output) {
    throw std::runtime_error("Failed to open summary file: " + path);
  }
  output << RunSummaryToJson(summary);
  if (!output) {
    throw std::runtime_error("Failed to write summary file: " + path);
  }
}

} // namespace erlflow
