#include "probe/dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

namespace reconkit::probe {

ProbeDispatcher::ProbeDispatcher(IProbeExecutor& executor, const core::CancellationToken& cancel,
                                 core::logging::Logger& logger)
    : executor_(executor), cancel_(cancel), logger_(logger) {}

ProbeDispatcher::~ProbeDispatcher() {
  // Abandoning an undrained run: stop claiming work, drop late outcomes, and
  // wait for in-flight probes, each of which is bounded by its own deadline.
  stop_requested_.store(true, std::memory_order_release);
  channel_.Close();
  JoinWorkers();
}

bool ProbeDispatcher::Start(std::string target, std::vector<ProbeSpec> specs,
                            const DispatchOptions& options, std::string& error) {
  if (running_) {
    error = "dispatcher is still running a previous scan";
    return false;
  }
  if (target.empty()) {
    error = "scan target cannot be empty";
    return false;
  }
  if (options.worker_count == 0U) {
    error = "worker count must be at least 1";
    return false;
  }
  if (options.probe_timeout <= std::chrono::milliseconds::zero()) {
    error = "probe timeout must be positive";
    return false;
  }

  JoinWorkers();
  target_ = std::move(target);
  specs_ = std::move(specs);
  options_ = options;
  next_index_.store(0U);
  stop_requested_.store(false);
  channel_.Reset();
  running_ = true;

  const std::size_t worker_count = std::min(options_.worker_count, specs_.size());
  if (worker_count == 0U) {
    channel_.Close();
    return true;
  }

  logger_.Debug("dispatching probes", {{"target", target_},
                                       {"probes", std::to_string(specs_.size())},
                                       {"workers", std::to_string(worker_count)},
                                       {"timeout_ms", std::to_string(options_.probe_timeout.count())}});

  active_workers_.store(worker_count);
  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    try {
      workers_.emplace_back(&ProbeDispatcher::WorkerLoop, this);
    } catch (const std::system_error& ex) {
      logger_.Error("failed to spawn probe worker", {{"error", ex.what()}});
      const std::size_t missing = worker_count - i;
      if (active_workers_.fetch_sub(missing) == missing) {
        channel_.Close();
      }
      if (i == 0U) {
        running_ = false;
        error = std::string("failed to spawn probe workers: ") + ex.what();
        return false;
      }
      break;
    }
  }
  return true;
}

std::optional<ProbeOutcome> ProbeDispatcher::Next() {
  if (!running_) {
    return std::nullopt;
  }
  std::optional<ProbeOutcome> outcome = channel_.Receive();
  if (!outcome.has_value()) {
    JoinWorkers();
    running_ = false;
  }
  return outcome;
}

void ProbeDispatcher::WorkerLoop() {
  while (!cancel_.IsCancelled() && !stop_requested_.load(std::memory_order_acquire)) {
    const std::size_t index = next_index_.fetch_add(1U);
    if (index >= specs_.size()) {
      break;
    }

    ProbeOutcome outcome = RunOne(index);
    if (outcome.failure == FailureCategory::kCancelled) {
      logger_.Debug("probe abandoned on cancellation", {{"probe", outcome.spec_id}});
      break;
    }
    if (!channel_.Push(std::move(outcome))) {
      break;
    }
  }

  if (active_workers_.fetch_sub(1U) == 1U) {
    channel_.Close();
  }
}

ProbeOutcome ProbeDispatcher::RunOne(std::size_t index) {
  const ProbeSpec& spec = specs_[index];
  const auto started = std::chrono::steady_clock::now();

  ProbeOutcome outcome;
  try {
    outcome = executor_.Execute(spec, target_, options_.probe_timeout, cancel_);
  } catch (const std::exception& ex) {
    // Executors report failures as outcomes; anything thrown anyway is still
    // confined to this probe.
    outcome = MakeFailureOutcome(net::TransportFailure::kTransport, target_,
                                 std::string("probe execution raised: ") + ex.what());
  }

  outcome.spec_index = index;
  outcome.spec_id = spec.id;
  outcome.kind = spec.kind();
  outcome.elapsed = std::chrono::steady_clock::now() - started;

  logger_.Debug("probe finished", {{"probe", spec.id},
                                   {"kind", ToString(outcome.kind)},
                                   {"outcome", ToString(outcome.outcome)},
                                   {"failure", ToString(outcome.failure)}});
  return outcome;
}

void ProbeDispatcher::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

} // namespace reconkit::probe
