#pragma once

#include <erlflow/models.h>

namespace erlflow {

constexpr int kExitClean = 0;
constexpr int kExitFatal = 1;
constexpr int kExitIsolatedErrors = 2;

// Fatal for aborted runs; isolated errors when any file failed or any group
// was skipped. Unresolved variable reads are warnings and keep a run clean.
int RunExitCode(const RunSummary &summary);

} // namespace erlflow
