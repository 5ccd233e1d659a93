#pragma once

#include <erlflow/interfaces.h>
#include <erlflow/logging.h>

#include <memory>

namespace erlflow {

// Walks a repository checkout for Erlang sources. Excluded directory names
// and ignored paths are pruned; files outside the size window are reported
// as skipped. Candidates are ordered by relative path.
class ErlangSourceLocator : public SourceLocator {
public:
  explicit ErlangSourceLocator(std::shared_ptr<Logger> logger = nullptr);
  SourceDiscoveryResult Locate(const CorpusConfig &config) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace erlflow
