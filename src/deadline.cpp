#include <erlflow/deadline.h>

#include <erlflow/errors.h>

#include <string>

namespace erlflow {

Deadline::Deadline(std::chrono::milliseconds budget)
    : bounded_(budget.count() > 0),
      expires_at_(std::chrono::steady_clock::now() + budget) {}

Deadline Deadline::Unbounded() { return Deadline(); }

bool Deadline::Expired() const {
  return bounded_ && std::chrono::steady_clock::now() >= expires_at_;
}

void Deadline::Check(std::string_view stage) const {
  if (Expired()) {
    throw FileTimeoutError(std::string(stage));
  }
}

} // namespace erlflow
