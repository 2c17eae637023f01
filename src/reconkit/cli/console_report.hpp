#pragma once

#include "probe/aggregator.hpp"
#include "probe/lookup_cache.hpp"
#include "tools/server_info.hpp"
#include "tools/server_recon.hpp"

#include <ostream>
#include <string>

namespace reconkit::cli {

// Plain-text console rendering for the three tools. Everything goes to the
// stream the caller passes so tests can capture it; logs stay on stderr.

// "[+] GitHub present (0.42s) status 200 ..." style line for any verdict.
std::string FormatVerdictLine(const probe::ScanEntry& entry);

void PrintUsernameEntry(std::ostream& out, const probe::ScanEntry& entry);
void PrintPortEntry(std::ostream& out, const probe::ScanEntry& entry, int port);
void PrintPathEntry(std::ostream& out, const probe::ScanEntry& entry);

// Counts, completeness and duration of one scan.
void PrintScanSummary(std::ostream& out, const probe::ScanReport& report);

void PrintServerInfoSnapshot(std::ostream& out, const tools::ServerInfoSnapshot& snapshot);
void PrintMonitorStatus(std::ostream& out, const tools::MonitorStats& stats, bool running);
void PrintMonitorSummary(std::ostream& out, const tools::MonitorStats& stats,
                         const probe::LookupCache<std::string, geo::GeoInfo>& geo_cache);

void PrintServerDetails(std::ostream& out, const tools::ServerDetails& details);
void PrintRobotsReport(std::ostream& out, const tools::RobotsReport& robots);

// Console observer for the info monitor loop.
class ConsoleMonitorObserver final : public tools::IMonitorObserver {
public:
  explicit ConsoleMonitorObserver(std::ostream& out) : out_(out) {}

  void OnPassStarted(std::size_t pass_number,
                     std::chrono::system_clock::time_point started_at) override;
  void OnSnapshot(const tools::ServerInfoSnapshot& snapshot) override;
  void OnPassFailed(const std::string& error) override;
  void OnStatus(const tools::MonitorStats& stats) override;
  void OnWaiting(std::chrono::milliseconds interval) override;

  const tools::ServerInfoSnapshot* last_snapshot() const {
    return has_snapshot_ ? &last_snapshot_ : nullptr;
  }

private:
  std::ostream& out_;
  tools::ServerInfoSnapshot last_snapshot_;
  bool has_snapshot_ = false;
};

} // namespace reconkit::cli
