#pragma once

#include "core/cancellation.hpp"
#include "probe/probe_outcome.hpp"
#include "probe/probe_spec.hpp"

#include <chrono>
#include <string_view>

namespace reconkit::probe {

// Performs the kind-specific network operation for one probe.
//
// Contract:
// - `timeout` is a hard deadline enforced at the transport layer
// - every failure becomes an outcome; implementations must not throw
// - when `cancel` fires, return promptly with `FailureCategory::kCancelled`
//   after releasing sockets/handles
// - identity fields and `elapsed` are filled in by the dispatcher
class IProbeExecutor {
public:
  virtual ~IProbeExecutor() = default;

  virtual ProbeOutcome Execute(const ProbeSpec& spec, std::string_view target,
                               std::chrono::milliseconds timeout,
                               const core::CancellationToken& cancel) = 0;
};

} // namespace reconkit::probe
