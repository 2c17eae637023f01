#pragma once

#include "core/cancellation.hpp"
#include "core/logging/logger.hpp"
#include "geo/geolocation.hpp"
#include "probe/aggregator.hpp"
#include "probe/dispatcher.hpp"
#include "probe/lookup_cache.hpp"
#include "probe/probe_executor.hpp"
#include "probe/probe_spec.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reconkit::probe {

struct ScanRequest {
  std::string target;
  std::vector<ProbeSpec> specs;
  DispatchOptions options;
};

// Invoked on the draining thread for every entry, in completion order.
using ScanEntryCallback = std::function<void(const ScanEntry&)>;

// Loader used on a geolocation cache miss.
using GeolocationLoader = std::function<bool(const std::string& ip, std::chrono::milliseconds timeout,
                                             geo::GeoInfo& info, std::string& error)>;

// State shared by every scan of one tool run: the cancellation token the
// SIGINT bridge flips, and the geolocation cache. Several scans may run
// back to back (the info monitor loop) or from several threads; each scan
// gets its own dispatcher and aggregator.
class ScanSession {
public:
  ScanSession(IProbeExecutor& executor, core::logging::Logger& logger);

  ScanSession(const ScanSession&) = delete;
  ScanSession& operator=(const ScanSession&) = delete;

  // Dispatches the request, classifies every outcome and aggregates the
  // verdicts. Returns false only when the scan could not start. A cancelled
  // scan still returns true with `report.complete == false`.
  bool RunScan(ScanRequest request, const ScanEntryCallback& on_entry, ScanReport& report,
               std::string& error);

  // Cached geolocation of `ip`. Concurrent misses for the same address share
  // one outbound lookup; failures are not cached.
  std::optional<geo::GeoInfo> LookupGeolocation(const std::string& ip,
                                                std::chrono::milliseconds timeout);

  // Replaces the network-backed geolocation loader.
  void SetGeolocationLoader(GeolocationLoader loader);

  void Cancel() {
    cancel_.Cancel();
  }

  bool cancelled() const {
    return cancel_.IsCancelled();
  }

  core::CancellationToken& cancellation() {
    return cancel_;
  }

  core::logging::Logger& logger() {
    return logger_;
  }

  std::size_t scans_run() const;

  const LookupCache<std::string, geo::GeoInfo>& geo_cache() const {
    return geo_cache_;
  }

private:
  IProbeExecutor& executor_;
  core::logging::Logger& logger_;
  core::CancellationToken cancel_;
  LookupCache<std::string, geo::GeoInfo> geo_cache_;
  GeolocationLoader geo_loader_;

  mutable std::mutex mu_;
  std::size_t scans_run_ = 0;
};

} // namespace reconkit::probe
