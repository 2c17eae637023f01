#pragma once

#include "net/http_client.hpp"
#include "probe/aggregator.hpp"
#include "probe/dispatcher.hpp"
#include "probe/scan_session.hpp"
#include "tools/port_catalog.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reconkit::tools {

// Common hidden paths, relative to the target URL.
const std::vector<std::string>& HiddenPaths();

// Response headers worth surfacing besides `Server`, in display order.
const std::vector<std::string>& InterestingHeaders();

struct ReconTarget {
  std::string url;
  std::string hostname;
  // True when `http://` was prefixed to the user input.
  bool added_scheme = false;
  // Numeric address of `hostname`, set by ResolveReconTarget. Port probes
  // connect to it so no worker blocks in the resolver.
  std::string address;
};

// Normalizes user input to an absolute URL and extracts its host.
bool PrepareReconTarget(std::string_view raw, ReconTarget& target, std::string& error);

// Resolves the target host once and stores its primary address.
bool ResolveReconTarget(ReconTarget& target, std::string& error);

struct ServerDetails {
  std::string ip;
  std::optional<long> status_code;
  std::string server = "Not Found";
  // Interesting headers that were present, in InterestingHeaders() order.
  net::HttpHeaders headers;
  std::string error;
};

struct RobotsReport {
  std::string url;
  bool found = false;
  std::optional<long> status_code;
  // Non-comment lines carrying an Allow or Disallow directive, trimmed.
  std::vector<std::string> directives;
  std::string error;
};

struct HiddenPathHit {
  std::string url;
  long status_code = 0;
  std::size_t size_bytes = 0;
};

struct ReconOptions {
  std::vector<int> ports = ReconPorts();
  std::vector<std::string> paths = HiddenPaths();
  probe::DispatchOptions port_dispatch{.worker_count = 20,
                                       .probe_timeout = std::chrono::milliseconds(2'000)};
  probe::DispatchOptions path_dispatch{.worker_count = 10,
                                       .probe_timeout = std::chrono::milliseconds(5'000)};
  // Timeout for the single server-header and robots.txt fetches.
  std::chrono::milliseconds fetch_timeout{10'000};
};

// Fetches the target URL (redirects followed) to read the server software
// and interesting headers. The host is resolved here unless
// `target.address` is already set. Failures are recorded in
// `details.error`; the scan goes on.
ServerDetails GatherServerDetails(probe::ScanSession& session, const ReconTarget& target,
                                  const ReconOptions& options);

// Threaded TCP connect scan of `options.ports` against `target.address`.
// Fails without probing when the target has not been resolved.
bool ScanReconPorts(probe::ScanSession& session, const ReconTarget& target,
                    const ReconOptions& options, const probe::ScanEntryCallback& on_entry,
                    probe::ScanReport& report, std::string& error);

// Extracts Allow/Disallow lines from a robots.txt body.
std::vector<std::string> ParseRobotsDirectives(std::string_view body);

// Fetches `/robots.txt` at the target's origin.
RobotsReport FetchRobots(probe::ScanSession& session, const ReconTarget& target,
                         const ReconOptions& options);

// Path probes for `options.paths` resolved against the target URL.
bool FindHiddenPaths(probe::ScanSession& session, const ReconTarget& target,
                     const ReconOptions& options, const probe::ScanEntryCallback& on_entry,
                     probe::ScanReport& report, std::string& error);

// Present path probes of `report` in path-table order.
std::vector<HiddenPathHit> CollectHiddenPathHits(const probe::ScanReport& report);

} // namespace reconkit::tools
