#include "probe/scan_session.hpp"

#include "core/time_utils.hpp"
#include "probe/classifier.hpp"

#include <utility>

namespace reconkit::probe {

ScanSession::ScanSession(IProbeExecutor& executor, core::logging::Logger& logger)
    : executor_(executor), logger_(logger) {
  geo_loader_ = [this](const std::string& ip, std::chrono::milliseconds timeout,
                       geo::GeoInfo& info, std::string& error) {
    return geo::LookupGeolocation(ip, timeout, cancel_, info, error);
  };
}

bool ScanSession::RunScan(ScanRequest request, const ScanEntryCallback& on_entry,
                          ScanReport& report, std::string& error) {
  std::size_t scan_number = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    scan_number = ++scans_run_;
  }

  const std::size_t expected = request.specs.size();
  ResultAggregator aggregator(request.target, expected);
  ProbeDispatcher dispatcher(executor_, cancel_, logger_);
  if (!dispatcher.Start(request.target, std::move(request.specs), request.options, error)) {
    return false;
  }

  logger_.Info("scan started", {{"target", request.target},
                                {"scan", std::to_string(scan_number)},
                                {"probes", std::to_string(expected)},
                                {"workers", std::to_string(request.options.worker_count)},
                                {"timeout_ms", std::to_string(request.options.probe_timeout.count())}});

  while (std::optional<ProbeOutcome> outcome = dispatcher.Next()) {
    const ProbeSpec& spec = dispatcher.specs()[outcome->spec_index];
    ScanEntry entry{std::move(*outcome), Verdict{}};
    entry.verdict = Classify(spec, entry.outcome);
    if (on_entry) {
      on_entry(entry);
    }

    std::string add_error;
    if (!aggregator.Add(std::move(entry.outcome), std::move(entry.verdict), add_error)) {
      logger_.Warn("dropped probe verdict", {{"probe", spec.id}, {"error", add_error}});
    }
  }

  aggregator.Finalize();
  report = aggregator.Snapshot();

  if (!report.complete) {
    logger_.Warn("scan incomplete", {{"target", report.target},
                                     {"received", std::to_string(report.received())},
                                     {"submitted", std::to_string(report.submitted)},
                                     {"cancelled", cancel_.IsCancelled() ? "true" : "false"}});
  }
  logger_.Info("scan finished", {{"target", report.target},
                                 {"present", std::to_string(report.present)},
                                 {"absent", std::to_string(report.absent)},
                                 {"indeterminate", std::to_string(report.indeterminate)},
                                 {"duration_s", core::FormatSeconds(report.duration)}});
  return true;
}

std::optional<geo::GeoInfo> ScanSession::LookupGeolocation(const std::string& ip,
                                                           std::chrono::milliseconds timeout) {
  GeolocationLoader loader;
  {
    std::lock_guard<std::mutex> lock(mu_);
    loader = geo_loader_;
  }

  return geo_cache_.GetOrPopulate(ip, [&]() -> std::optional<geo::GeoInfo> {
    geo::GeoInfo info;
    std::string error;
    if (!loader) {
      logger_.Warn("geolocation lookup skipped", {{"ip", ip}, {"error", "no loader configured"}});
      return std::nullopt;
    }
    if (!loader(ip, timeout, info, error)) {
      logger_.Warn("geolocation lookup failed", {{"ip", ip}, {"error", error}});
      return std::nullopt;
    }
    logger_.Debug("geolocation cached", {{"ip", ip}, {"country", info.country}});
    return info;
  });
}

void ScanSession::SetGeolocationLoader(GeolocationLoader loader) {
  std::lock_guard<std::mutex> lock(mu_);
  geo_loader_ = std::move(loader);
}

std::size_t ScanSession::scans_run() const {
  std::lock_guard<std::mutex> lock(mu_);
  return scans_run_;
}

} // namespace reconkit::probe
