#include "tools/server_recon.hpp"

#include "net/dns_resolver.hpp"
#include "net/target.hpp"
#include "probe/probe_spec.hpp"

#include <algorithm>

namespace reconkit::tools {

namespace {

std::string_view TrimWhitespace(std::string_view text) {
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  const std::size_t first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1U);
}

} // namespace

const std::vector<std::string>& HiddenPaths() {
  static const std::vector<std::string> kPaths = {
      "admin",        "dashboard",  "login",        "wp-admin",     "phpmyadmin",
      ".git",         ".env",       "backup",       "api",          "config",
      "uploads",      "administrator", "mysql",     "test",         "hidden",
      "cgi-bin",      "phpinfo.php", "robots.txt",  ".htaccess",    "backup.zip",
      "wp-login.php", "administrator/index.php",    "server-status",
  };
  return kPaths;
}

const std::vector<std::string>& InterestingHeaders() {
  static const std::vector<std::string> kHeaders = {
      "X-Powered-By",   "X-Frame-Options", "Content-Type",
      "Content-Length", "Cache-Control",   "X-Content-Type-Options",
  };
  return kHeaders;
}

bool PrepareReconTarget(std::string_view raw, ReconTarget& target, std::string& error) {
  const std::string_view trimmed = TrimWhitespace(raw);
  if (trimmed.empty()) {
    error = "target cannot be empty";
    return false;
  }

  ReconTarget prepared;
  if (!net::NormalizeHttpUrl(trimmed, prepared.url, prepared.added_scheme, error)) {
    return false;
  }
  if (!net::ExtractHost(prepared.url, prepared.hostname, error)) {
    return false;
  }
  target = std::move(prepared);
  return true;
}

bool ResolveReconTarget(ReconTarget& target, std::string& error) {
  net::HostResolution resolution;
  if (!net::ResolveHost(target.hostname, resolution, error)) {
    return false;
  }
  target.address = resolution.primary_ip;
  return true;
}

ServerDetails GatherServerDetails(probe::ScanSession& session, const ReconTarget& target,
                                  const ReconOptions& options) {
  ServerDetails details;

  std::string error;
  if (target.address.empty()) {
    net::HostResolution resolution;
    if (!net::ResolveHost(target.hostname, resolution, error)) {
      details.error = "DNS resolution failed: " + error;
      return details;
    }
    details.ip = resolution.primary_ip;
  } else {
    details.ip = target.address;
  }

  probe::ScanRequest request;
  request.target = target.url;
  request.specs.push_back(
      probe::MakeHeaderFetchSpec("server", "{}", std::nullopt, /*follow_redirects=*/true));
  request.options.worker_count = 1;
  request.options.probe_timeout = options.fetch_timeout;

  probe::ScanReport report;
  if (!session.RunScan(std::move(request), nullptr, report, error)) {
    details.error = "HTTP request failed to start: " + error;
    return details;
  }
  if (report.entries.empty()) {
    details.error = "HTTP request did not complete";
    return details;
  }

  const probe::ScanEntry& entry = report.entries.front();
  if (entry.verdict.state != probe::VerdictState::kPresent) {
    details.error = "HTTP request failed: " + entry.outcome.error;
    return details;
  }

  details.status_code = entry.outcome.status_code;
  details.server = net::FindHeader(entry.outcome.headers, "Server").value_or("Not Found");
  for (const auto& name : InterestingHeaders()) {
    const std::optional<std::string> value = net::FindHeader(entry.outcome.headers, name);
    if (value.has_value()) {
      details.headers.emplace_back(name, *value);
    }
  }
  return details;
}

bool ScanReconPorts(probe::ScanSession& session, const ReconTarget& target,
                    const ReconOptions& options, const probe::ScanEntryCallback& on_entry,
                    probe::ScanReport& report, std::string& error) {
  if (target.address.empty()) {
    error = "no resolved address for " + target.hostname;
    return false;
  }
  probe::ScanRequest request;
  request.target = target.address;
  request.specs = probe::MakePortScanSpecs(options.ports, /*capture_banner=*/false);
  request.options = options.port_dispatch;
  return session.RunScan(std::move(request), on_entry, report, error);
}

std::vector<std::string> ParseRobotsDirectives(std::string_view body) {
  std::vector<std::string> directives;
  std::size_t start = 0;
  while (start <= body.size()) {
    const std::size_t end = body.find('\n', start);
    const std::string_view raw_line =
        body.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    const std::string_view line = TrimWhitespace(raw_line);
    // Substring match: "Allow:" also covers "Disallow:" and indented or
    // prefixed directive lines.
    if (!line.empty() && line.front() != '#' && line.find("Allow:") != std::string_view::npos) {
      directives.emplace_back(line);
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1U;
  }
  return directives;
}

RobotsReport FetchRobots(probe::ScanSession& session, const ReconTarget& target,
                         const ReconOptions& options) {
  RobotsReport robots;
  std::string error;
  if (!net::ResolveUrlReference(target.url, "/robots.txt", robots.url, error)) {
    robots.error = error;
    return robots;
  }

  net::HttpRequest request;
  request.url = robots.url;
  request.timeout = options.fetch_timeout;
  request.follow_redirects = true;
  request.capture_body = true;
  const net::HttpResult result = net::HttpGet(request, &session.cancellation());
  if (!result.ok()) {
    robots.error = std::string(net::ToString(result.failure)) + ": " + result.error;
    session.logger().Debug("robots.txt fetch failed", {{"url", robots.url}, {"error", robots.error}});
    return robots;
  }

  robots.status_code = result.response.status_code;
  if (result.response.status_code != 200) {
    return robots;
  }
  robots.found = true;
  robots.directives = ParseRobotsDirectives(result.response.body);
  return robots;
}

bool FindHiddenPaths(probe::ScanSession& session, const ReconTarget& target,
                     const ReconOptions& options, const probe::ScanEntryCallback& on_entry,
                     probe::ScanReport& report, std::string& error) {
  probe::ScanRequest request;
  request.target = target.url;
  request.specs.reserve(options.paths.size());
  for (const auto& path : options.paths) {
    request.specs.push_back(probe::MakePathProbeSpec(path));
  }
  request.options = options.path_dispatch;
  return session.RunScan(std::move(request), on_entry, report, error);
}

std::vector<HiddenPathHit> CollectHiddenPathHits(const probe::ScanReport& report) {
  std::vector<const probe::ScanEntry*> present;
  for (const auto& entry : report.entries) {
    if (entry.verdict.state == probe::VerdictState::kPresent) {
      present.push_back(&entry);
    }
  }
  std::sort(present.begin(), present.end(), [](const auto* lhs, const auto* rhs) {
    return lhs->verdict.spec_index < rhs->verdict.spec_index;
  });

  std::vector<HiddenPathHit> hits;
  hits.reserve(present.size());
  for (const auto* entry : present) {
    hits.push_back(HiddenPathHit{entry->outcome.endpoint, entry->outcome.status_code.value_or(0),
                                 entry->outcome.body_bytes});
  }
  return hits;
}

} // namespace reconkit::tools
