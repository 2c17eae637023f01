#pragma once

#include "geo/geolocation.hpp"
#include "net/dns_resolver.hpp"
#include "net/http_client.hpp"
#include "probe/aggregator.hpp"
#include "probe/dispatcher.hpp"
#include "probe/scan_session.hpp"
#include "tools/port_catalog.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace reconkit::tools {

inline constexpr std::chrono::seconds kDefaultMonitorInterval{30};
inline constexpr std::chrono::seconds kMinimumMonitorInterval{5};

struct OpenPort {
  int port = 0;
  std::string service;
  std::string banner;
};

struct WebServerInfo {
  // "HTTP" or "HTTPS": which of the two attempts answered.
  std::string protocol;
  long status_code = 0;
  std::string server;
  net::HttpHeaders headers;
};

// Everything one gathering pass learned about a host.
struct ServerInfoSnapshot {
  std::string hostname;
  std::chrono::system_clock::time_point gathered_at{};
  net::HostResolution resolution;
  std::optional<std::string> reverse_dns;
  std::optional<geo::GeoInfo> geolocation;
  std::vector<OpenPort> open_ports;
  std::optional<WebServerInfo> web;
  probe::ScanReport port_report;
  probe::ScanReport web_report;
};

struct ServerInfoOptions {
  std::vector<int> ports = InfoGathererPorts();
  probe::DispatchOptions port_dispatch{.worker_count = 10,
                                       .probe_timeout = std::chrono::milliseconds(1'000)};
  probe::DispatchOptions web_dispatch{.worker_count = 1,
                                      .probe_timeout = std::chrono::milliseconds(5'000)};
  std::chrono::milliseconds geo_timeout{5'000};
};

// One gathering pass: resolve, reverse DNS, cached geolocation, common-port
// scan with banner capture, then an HTTP (falling back to HTTPS) header fetch
// against the primary address. Fails only when the hostname does not resolve
// or a scan cannot start; a cancelled pass returns what it gathered.
bool GatherServerInfo(probe::ScanSession& session, const std::string& hostname,
                      const ServerInfoOptions& options, ServerInfoSnapshot& snapshot,
                      std::string& error);

struct MonitorOptions {
  // Pause between passes. The CLI clamps user input to kMinimumMonitorInterval.
  std::chrono::milliseconds interval = kDefaultMonitorInterval;
  // 0 runs until cancelled.
  std::size_t iterations = 0;
  // A status report is emitted after every `status_every` passes.
  std::size_t status_every = 3;
  ServerInfoOptions info;
};

struct MonitorStats {
  std::size_t scan_count = 0;
  std::size_t failed_scans = 0;
  // Primary addresses seen, in first-seen order.
  std::vector<std::string> unique_servers;
};

// Receives monitor progress on the monitoring thread.
class IMonitorObserver {
public:
  virtual ~IMonitorObserver() = default;

  virtual void OnPassStarted(std::size_t pass_number,
                             std::chrono::system_clock::time_point started_at) = 0;
  virtual void OnSnapshot(const ServerInfoSnapshot& snapshot) = 0;
  virtual void OnPassFailed(const std::string& error) = 0;
  virtual void OnStatus(const MonitorStats& stats) = 0;
  virtual void OnWaiting(std::chrono::milliseconds interval) = 0;
};

// Clamps a user-supplied interval to the supported minimum. `clamped` reports
// whether the value was raised.
std::chrono::seconds ClampMonitorInterval(std::chrono::seconds requested, bool& clamped);

// Repeats GatherServerInfo until `iterations` passes ran or the session is
// cancelled. The wait between passes is interrupted by cancellation.
void RunServerMonitor(probe::ScanSession& session, const std::string& hostname,
                      const MonitorOptions& options, IMonitorObserver& observer,
                      MonitorStats& stats);

} // namespace reconkit::tools
