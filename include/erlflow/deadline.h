#pragma once

#include <chrono>
#include <string_view>

namespace erlflow {

// Cooperative per-file time budget. Long-running stages poll Check(), which
// throws FileTimeoutError once the budget is spent.
class Deadline {
public:
  explicit Deadline(std::chrono::milliseconds budget);

  static Deadline Unbounded();

  bool Expired() const;
  void Check(std::string_view stage) const;

private:
  Deadline() = default;

  bool bounded_ = false;
  std::chrono::steady_clock::time_point expires_at_{};
};

} // namespace erlflow
