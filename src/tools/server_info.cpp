#include "tools/server_info.hpp"

#include "probe/probe_spec.hpp"

#include <algorithm>
#include <utility>

namespace reconkit::tools {

namespace {

// URL host form of a numeric address.
std::string UrlHost(const std::string& ip) {
  if (ip.find(':') != std::string::npos) {
    return "[" + ip + "]";
  }
  return ip;
}

std::vector<OpenPort> CollectOpenPorts(const probe::ScanReport& report,
                                       const std::vector<int>& ports) {
  std::vector<const probe::ScanEntry*> present;
  for (const auto& entry : report.entries) {
    if (entry.verdict.state == probe::VerdictState::kPresent) {
      present.push_back(&entry);
    }
  }
  // Report open ports in scan-table order rather than completion order.
  std::sort(present.begin(), present.end(), [](const auto* lhs, const auto* rhs) {
    return lhs->verdict.spec_index < rhs->verdict.spec_index;
  });

  std::vector<OpenPort> open_ports;
  open_ports.reserve(present.size());
  for (const auto* entry : present) {
    const int port = ports.at(entry->verdict.spec_index);
    open_ports.push_back(OpenPort{port, ServiceName(port), entry->outcome.banner});
  }
  return open_ports;
}

std::optional<WebServerInfo> ExtractWebServerInfo(const probe::ScanReport& report) {
  for (const auto& entry : report.entries) {
    if (entry.verdict.state != probe::VerdictState::kPresent ||
        !entry.outcome.status_code.has_value()) {
      continue;
    }
    WebServerInfo web;
    web.protocol = entry.outcome.endpoint.rfind("https://", 0) == 0U ? "HTTPS" : "HTTP";
    web.status_code = *entry.outcome.status_code;
    web.server = net::FindHeader(entry.outcome.headers, "Server").value_or("Unknown");
    web.headers = entry.outcome.headers;
    return web;
  }
  return std::nullopt;
}

} // namespace

bool GatherServerInfo(probe::ScanSession& session, const std::string& hostname,
                      const ServerInfoOptions& options, ServerInfoSnapshot& snapshot,
                      std::string& error) {
  core::logging::Logger& logger = session.logger();
  snapshot = ServerInfoSnapshot{};
  snapshot.hostname = hostname;
  snapshot.gathered_at = std::chrono::system_clock::now();

  std::string resolve_error;
  if (!net::ResolveHost(hostname, snapshot.resolution, resolve_error)) {
    error = "DNS resolution failed: " + resolve_error;
    return false;
  }
  const std::string& primary_ip = snapshot.resolution.primary_ip;
  logger.Debug("host resolved", {{"hostname", hostname},
                                 {"primary_ip", primary_ip},
                                 {"addresses", std::to_string(snapshot.resolution.all_ips.size())}});

  std::string reverse_error;
  snapshot.reverse_dns = net::ReverseLookup(primary_ip, reverse_error);
  if (!snapshot.reverse_dns.has_value()) {
    logger.Debug("no reverse DNS record", {{"ip", primary_ip}, {"detail", reverse_error}});
  }

  snapshot.geolocation = session.LookupGeolocation(primary_ip, options.geo_timeout);

  probe::ScanRequest port_request;
  port_request.target = primary_ip;
  port_request.specs = probe::MakePortScanSpecs(options.ports, /*capture_banner=*/true);
  port_request.options = options.port_dispatch;
  if (!session.RunScan(std::move(port_request), nullptr, snapshot.port_report, error)) {
    error = "port scan failed to start: " + error;
    return false;
  }
  snapshot.open_ports = CollectOpenPorts(snapshot.port_report, options.ports);

  probe::ScanRequest web_request;
  web_request.target = UrlHost(primary_ip);
  web_request.specs.push_back(probe::MakeHeaderFetchSpec("web", "http://{}", "https://{}",
                                                         /*follow_redirects=*/false));
  web_request.options = options.web_dispatch;
  if (!session.RunScan(std::move(web_request), nullptr, snapshot.web_report, error)) {
    error = "web service check failed to start: " + error;
    return false;
  }
  snapshot.web = ExtractWebServerInfo(snapshot.web_report);
  return true;
}

std::chrono::seconds ClampMonitorInterval(std::chrono::seconds requested, bool& clamped) {
  clamped = requested < kMinimumMonitorInterval;
  return clamped ? kMinimumMonitorInterval : requested;
}

void RunServerMonitor(probe::ScanSession& session, const std::string& hostname,
                      const MonitorOptions& options, IMonitorObserver& observer,
                      MonitorStats& stats) {
  core::logging::Logger& logger = session.logger();
  logger.Info("monitoring started", {{"hostname", hostname},
                                     {"interval_ms", std::to_string(options.interval.count())},
                                     {"iterations", std::to_string(options.iterations)}});

  while (!session.cancelled()) {
    observer.OnPassStarted(stats.scan_count + 1U, std::chrono::system_clock::now());

    ServerInfoSnapshot snapshot;
    std::string error;
    if (GatherServerInfo(session, hostname, options.info, snapshot, error)) {
      const std::string& ip = snapshot.resolution.primary_ip;
      if (std::find(stats.unique_servers.begin(), stats.unique_servers.end(), ip) ==
          stats.unique_servers.end()) {
        stats.unique_servers.push_back(ip);
      }
      observer.OnSnapshot(snapshot);
    } else {
      ++stats.failed_scans;
      logger.Warn("gathering pass failed", {{"hostname", hostname}, {"error", error}});
      observer.OnPassFailed(error);
    }
    ++stats.scan_count;

    if (options.status_every > 0U && stats.scan_count % options.status_every == 0U) {
      observer.OnStatus(stats);
    }
    if (options.iterations > 0U && stats.scan_count >= options.iterations) {
      break;
    }
    if (session.cancelled()) {
      break;
    }

    observer.OnWaiting(options.interval);
    if (!session.cancellation().SleepFor(options.interval)) {
      break;
    }
  }

  logger.Info("monitoring stopped", {{"hostname", hostname},
                                     {"scans", std::to_string(stats.scan_count)},
                                     {"unique_servers", std::to_string(stats.unique_servers.size())}});
}

} // namespace reconkit::tools
