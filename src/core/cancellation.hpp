#ifndef RECONKIT_CORE_CANCELLATION_HPP_
#define RECONKIT_CORE_CANCELLATION_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace reconkit::core {

// One-shot cancellation flag shared between a scan session, its workers and
// the SIGINT bridge. The flag is a lock-free atomic so a signal handler may
// set it directly.
class CancellationToken {
public:
  // Granularity at which blocking network waits re-check the flag.
  static constexpr std::chrono::milliseconds kPollSlice{50};

  CancellationToken() = default;
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Sleeps for `duration` in poll slices. Returns false if cancelled before the
  // full duration elapsed.
  bool SleepFor(std::chrono::milliseconds duration) const {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!IsCancelled()) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return true;
      }
      const auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      std::this_thread::sleep_for(std::min(remaining, kPollSlice));
    }
    return false;
  }

  // Raw flag for the async-signal-safe interrupt bridge.
  std::atomic<bool>* flag() {
    return &cancelled_;
  }

private:
  std::atomic<bool> cancelled_{false};
  static_assert(std::atomic<bool>::is_always_lock_free,
                "cancellation flag must be settable from a signal handler");
};

} // namespace reconkit::core

#endif // RECONKIT_CORE_CANCELLATION_HPP_
