#include "reconkit/cli/console_report.hpp"

#include "core/time_utils.hpp"
#include "tools/port_catalog.hpp"

#include <sstream>

namespace reconkit::cli {

namespace {

const char* StateMark(probe::VerdictState state) {
  switch (state) {
  case probe::VerdictState::kPresent:
    return "[+]";
  case probe::VerdictState::kAbsent:
    return "[-]";
  case probe::VerdictState::kIndeterminate:
    return "[?]";
  }
  return "[?]";
}

// First line of a banner, cut to `max_chars` for one-line console output.
std::string BannerPreview(const std::string& banner, std::size_t max_chars) {
  std::string line = banner.substr(0, banner.find('\n'));
  if (line.size() > max_chars) {
    line.resize(max_chars);
  }
  return line;
}

} // namespace

std::string FormatVerdictLine(const probe::ScanEntry& entry) {
  std::ostringstream line;
  line << StateMark(entry.verdict.state) << ' ' << entry.verdict.spec_id << ' '
       << probe::ToString(entry.verdict.state) << " (" << core::FormatSeconds(entry.outcome.elapsed)
       << "s)";
  if (!entry.verdict.reason.empty()) {
    line << ' ' << entry.verdict.reason;
  }
  return line.str();
}

void PrintUsernameEntry(std::ostream& out, const probe::ScanEntry& entry) {
  switch (entry.verdict.state) {
  case probe::VerdictState::kPresent:
    out << "[ FOUND ] " << entry.verdict.spec_id << " ("
        << core::FormatSeconds(entry.outcome.elapsed) << "s)\n"
        << "     URL: " << entry.outcome.endpoint << '\n';
    return;
  case probe::VerdictState::kAbsent:
    out << "[ NOT FOUND ] " << entry.verdict.spec_id << " ("
        << core::FormatSeconds(entry.outcome.elapsed) << "s) " << entry.verdict.reason << '\n';
    return;
  case probe::VerdictState::kIndeterminate:
    out << "[ UNKNOWN ] " << entry.verdict.spec_id << " ("
        << core::FormatSeconds(entry.outcome.elapsed) << "s) " << entry.verdict.reason << '\n';
    return;
  }
}

void PrintPortEntry(std::ostream& out, const probe::ScanEntry& entry, int port) {
  if (entry.verdict.state == probe::VerdictState::kPresent) {
    out << "[+] Port " << port << "/tcp is OPEN - " << tools::ServiceName(port);
    if (!entry.outcome.banner.empty()) {
      out << " - " << BannerPreview(entry.outcome.banner, 50);
    }
    out << " (" << core::FormatSeconds(entry.outcome.elapsed) << "s)\n";
    return;
  }
  out << FormatVerdictLine(entry) << '\n';
}

void PrintPathEntry(std::ostream& out, const probe::ScanEntry& entry) {
  if (entry.verdict.state == probe::VerdictState::kPresent) {
    out << "[+] Found: " << entry.outcome.endpoint
        << " (Status: " << entry.outcome.status_code.value_or(0)
        << ", Size: " << entry.outcome.body_bytes << " bytes)\n";
    return;
  }
  out << FormatVerdictLine(entry) << '\n';
}

void PrintScanSummary(std::ostream& out, const probe::ScanReport& report) {
  out << "summary: present=" << report.present << " absent=" << report.absent
      << " indeterminate=" << report.indeterminate << " received=" << report.received() << '/'
      << report.submitted << " complete=" << (report.complete ? "yes" : "no")
      << " duration_s=" << core::FormatSeconds(report.duration) << '\n';
}

void PrintServerInfoSnapshot(std::ostream& out, const tools::ServerInfoSnapshot& snapshot) {
  const net::HostResolution& resolution = snapshot.resolution;
  out << "Primary IP: " << resolution.primary_ip << '\n';
  if (resolution.all_ips.size() > 1U) {
    out << "All IPs: ";
    for (std::size_t i = 0; i < resolution.all_ips.size(); ++i) {
      out << (i == 0U ? "" : ", ") << resolution.all_ips[i];
    }
    out << '\n';
  }
  if (resolution.canonical_name.has_value()) {
    out << "Canonical name: " << *resolution.canonical_name << '\n';
  }
  if (snapshot.reverse_dns.has_value()) {
    out << "Reverse DNS: " << *snapshot.reverse_dns << '\n';
  }

  if (snapshot.geolocation.has_value()) {
    const geo::GeoInfo& geo = *snapshot.geolocation;
    out << "Geolocation:\n"
        << "  Country: " << geo.country << '\n'
        << "  Region: " << geo.region << '\n'
        << "  City: " << geo.city << '\n'
        << "  ISP: " << geo.isp << '\n'
        << "  Organization: " << geo.org << '\n'
        << "  AS: " << geo.as << '\n';
  } else {
    out << "Geolocation data unavailable\n";
  }

  if (snapshot.open_ports.empty()) {
    out << "Open ports: none of the common ports are open\n";
  } else {
    out << "Open ports:\n";
    for (const auto& port : snapshot.open_ports) {
      out << "  Port " << port.port << " (" << port.service << ")";
      if (!port.banner.empty()) {
        out << " - " << BannerPreview(port.banner, 50);
      }
      out << '\n';
    }
  }
  PrintScanSummary(out, snapshot.port_report);

  if (snapshot.web.has_value()) {
    out << "Web server:\n"
        << "  Protocol: " << snapshot.web->protocol << '\n'
        << "  Status: " << snapshot.web->status_code << '\n'
        << "  Server: " << snapshot.web->server << '\n';
  } else {
    out << "HTTP/HTTPS not accessible\n";
  }
}

void PrintMonitorStatus(std::ostream& out, const tools::MonitorStats& stats, bool running) {
  out << "status: running=" << (running ? "yes" : "no") << " scans=" << stats.scan_count
      << " failed=" << stats.failed_scans << " unique_servers=" << stats.unique_servers.size()
      << '\n';
}

void PrintMonitorSummary(std::ostream& out, const tools::MonitorStats& stats,
                         const probe::LookupCache<std::string, geo::GeoInfo>& geo_cache) {
  out << "Final summary\n"
      << "  Total scans performed: " << stats.scan_count << '\n'
      << "  Unique servers found: " << stats.unique_servers.size() << '\n'
      << "  Geolocation lookups cached: " << geo_cache.size() << '\n';
  if (stats.unique_servers.empty()) {
    return;
  }
  out << "  Monitored servers:\n";
  for (std::size_t i = 0; i < stats.unique_servers.size(); ++i) {
    const std::string& ip = stats.unique_servers[i];
    const std::optional<geo::GeoInfo> geo = geo_cache.Find(ip);
    out << "    " << (i + 1U) << ". " << ip << " - " << (geo.has_value() ? geo->country : "Unknown")
        << '\n';
  }
}

void PrintServerDetails(std::ostream& out, const tools::ServerDetails& details) {
  if (!details.ip.empty()) {
    out << "[+] IP Address: " << details.ip << '\n';
  }
  if (!details.error.empty()) {
    out << "[-] " << details.error << '\n';
    return;
  }
  if (details.status_code.has_value()) {
    out << "[+] HTTP Status: " << *details.status_code << '\n';
  }
  out << "[+] Server Software: " << details.server << '\n';
  for (const auto& [name, value] : details.headers) {
    out << "[*] " << name << ": " << value << '\n';
  }
}

void PrintRobotsReport(std::ostream& out, const tools::RobotsReport& robots) {
  if (!robots.error.empty()) {
    out << "[*] Failed to fetch robots.txt: " << robots.error << '\n';
    return;
  }
  if (!robots.found) {
    out << "[*] No robots.txt found or not accessible";
    if (robots.status_code.has_value()) {
      out << " (status " << *robots.status_code << ")";
    }
    out << '\n';
    return;
  }
  out << "[+] robots.txt found!\n";
  for (const auto& directive : robots.directives) {
    out << "  " << directive << '\n';
  }
}

void ConsoleMonitorObserver::OnPassStarted(std::size_t pass_number,
                                           std::chrono::system_clock::time_point started_at) {
  out_ << "\nScan #" << pass_number << " at " << core::FormatLocalTimestamp(started_at) << '\n'
       << std::string(60, '=') << '\n';
}

void ConsoleMonitorObserver::OnSnapshot(const tools::ServerInfoSnapshot& snapshot) {
  out_ << "Gathering information for: " << snapshot.hostname << '\n';
  PrintServerInfoSnapshot(out_, snapshot);
  last_snapshot_ = snapshot;
  has_snapshot_ = true;
}

void ConsoleMonitorObserver::OnPassFailed(const std::string& error) {
  out_ << "Error: " << error << '\n';
}

void ConsoleMonitorObserver::OnStatus(const tools::MonitorStats& stats) {
  PrintMonitorStatus(out_, stats, /*running=*/true);
}

void ConsoleMonitorObserver::OnWaiting(std::chrono::milliseconds interval) {
  out_ << "Next scan in " << core::FormatSeconds(interval) << " seconds...\n";
}

} // namespace reconkit::cli
