#pragma once

#include "probe/probe_outcome.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace reconkit::probe {

// Multi-producer, single-consumer queue carrying outcomes from workers to the
// draining caller. Closing wakes the consumer; buffered outcomes are still
// delivered before `Receive` reports exhaustion.
class OutcomeChannel {
public:
  OutcomeChannel() = default;
  OutcomeChannel(const OutcomeChannel&) = delete;
  OutcomeChannel& operator=(const OutcomeChannel&) = delete;

  // Returns false when the channel is already closed (the outcome is dropped).
  bool Push(ProbeOutcome outcome) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(outcome));
    }
    cv_.notify_one();
    return true;
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Blocks until an outcome is available or the channel is closed and empty.
  std::optional<ProbeOutcome> Receive() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
      return std::nullopt;
    }
    ProbeOutcome outcome = std::move(queue_.front());
    queue_.pop_front();
    return outcome;
  }

  void Reset() {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.clear();
    closed_ = false;
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<ProbeOutcome> queue_;
  bool closed_ = false;
};

} // namespace reconkit::probe
