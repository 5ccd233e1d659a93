#pragma once

#include <erlflow/models.h>

#include <cstddef>
#include <string>

namespace erlflow {

constexpr std::size_t kMaxErrorSamples = 3;

// Folds one file's outcome into the run totals. Record counts are not
// touched; the writer counts records as they reach the sink.
void AccumulateOutcome(RunSummary &summary, const FileOutcome &outcome);
void AccumulateIssue(RunSummary &summary, const ProcessingIssue &issue);

std::string FormatRunSummary(const RunSummary &summary);
std::string RunSummaryToJson(const RunSummary &summary);

// Writes RunSummaryToJson to `path`. Throws std::runtime_error on failure.
void WriteRunSummary(const RunSummary &summary, const std::string &path);

} // namespace erlflow
