#pragma once

#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"
#include "probe/outcome_channel.hpp"
#include "probe/probe_executor.hpp"
#include "probe/probe_spec.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace reconkit::probe {

struct DispatchOptions {
  // Maximum number of probes in flight at once.
  std::size_t worker_count = 10;
  // Hard per-probe deadline passed to the executor.
  std::chrono::milliseconds probe_timeout{5'000};
};

// Bounded fan-out of probes over a fixed worker pool.
//
// Usage:
//   ProbeDispatcher dispatcher(executor, cancel, logger);
//   dispatcher.Start(target, specs, options, error);
//   while (auto outcome = dispatcher.Next()) { ... }
//
// Every submitted spec yields exactly one outcome unless the scan is cancelled,
// in which case workers stop claiming specs, in-flight probes are abandoned,
// and `Next` returns nullopt once the remaining buffered outcomes are drained.
// Outcomes arrive in completion order, not submission order.
class ProbeDispatcher {
public:
  ProbeDispatcher(IProbeExecutor& executor, const core::CancellationToken& cancel,
                  core::logging::Logger& logger);
  ~ProbeDispatcher();

  ProbeDispatcher(const ProbeDispatcher&) = delete;
  ProbeDispatcher& operator=(const ProbeDispatcher&) = delete;

  // Validates inputs and launches `min(worker_count, specs.size())` workers.
  // Fails (without starting anything) on an empty target, zero workers, a
  // non-positive timeout, or when a previous run has not been drained.
  bool Start(std::string target, std::vector<ProbeSpec> specs, const DispatchOptions& options,
             std::string& error);

  // Next outcome in completion order; nullopt when the run is exhausted.
  // Joins the workers once exhausted.
  std::optional<ProbeOutcome> Next();

  std::size_t submitted() const {
    return specs_.size();
  }

  const std::vector<ProbeSpec>& specs() const {
    return specs_;
  }

private:
  void WorkerLoop();
  ProbeOutcome RunOne(std::size_t index);
  void JoinWorkers();

  IProbeExecutor& executor_;
  const core::CancellationToken& cancel_;
  core::logging::Logger& logger_;

  std::string target_;
  std::vector<ProbeSpec> specs_;
  DispatchOptions options_;

  OutcomeChannel channel_;
  std::atomic<std::size_t> next_index_{0};
  std::atomic<std::size_t> active_workers_{0};
  std::atomic<bool> stop_requested_{false};
  std::vector<std::thread> workers_;
  bool running_ = false;
};

} // namespace reconkit::probe
