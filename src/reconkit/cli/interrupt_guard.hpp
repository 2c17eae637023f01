#pragma once

#include "core/cancellation.hpp"

#include <signal.h>

namespace reconkit::cli {

// Routes SIGINT and SIGTERM into a cancellation token for its lifetime and
// restores the previous handlers on destruction.
//
// The handler only stores `true` into the token's lock-free flag; workers and
// the monitor loop notice it at their next poll slice. One guard may be
// active per process.
class InterruptGuard {
public:
  explicit InterruptGuard(core::CancellationToken& token);
  ~InterruptGuard();

  InterruptGuard(const InterruptGuard&) = delete;
  InterruptGuard& operator=(const InterruptGuard&) = delete;

  // False when the handlers could not be installed or another guard is active.
  bool installed() const {
    return installed_;
  }

  // True once a signal was delivered while this guard was installed.
  static bool Triggered();

private:
  struct sigaction previous_int_{};
  struct sigaction previous_term_{};
  bool installed_ = false;
};

} // namespace reconkit::cli
