#include <erlflow/cli_exit_codes.h>

namespace erlflow {

int RunExitCode(const RunSummary &summary) {
  if (summary.aborted) {
    return kExitFatal;
  }
  if (summary.files_failed > 0) {
    return kExitIsolatedErrors;
  }
  for (const auto &[kind, tally] : summary.errors) {
    if (kind != ErrorKind::kScope && tally.count > 0) {
      return kExitIsolatedErrors;
    }
  }
  return kExitClean;
}

} // namespace erlflow
