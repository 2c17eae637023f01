#include "common/assertions.hpp"
#include "common/scripted_executor.hpp"
#include "core/logging/logger.hpp"
#include "probe/scan_session.hpp"
#include "tools/server_info.hpp"
#include "tools/server_recon.hpp"
#include "tools/username_search.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace {

using reconkit::tests::common::Assert;
using reconkit::tests::common::AssertContains;
using reconkit::tests::common::Fail;
using reconkit::tests::common::MakeConnectOutcome;
using reconkit::tests::common::MakeHttpOutcome;
using reconkit::tests::common::MakeRefusedOutcome;
using reconkit::tests::common::ScriptedProbe;
using reconkit::tests::common::ScriptedProbeExecutor;

namespace probe = reconkit::probe;
namespace tools = reconkit::tools;
namespace geo = reconkit::geo;
using std::chrono::milliseconds;

std::map<std::string, probe::VerdictState> VerdictsById(const probe::ScanReport& report) {
  std::map<std::string, probe::VerdictState> verdicts;
  for (const auto& entry : report.entries) {
    verdicts[entry.verdict.spec_id] = entry.verdict.state;
  }
  return verdicts;
}

// Port 80 answers, 81 refuses, 9999 is filtered: one present, two absent.
void RunPortScan(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  executor.Script("80/tcp", ScriptedProbe{milliseconds(5), MakeConnectOutcome(), false});
  executor.Script("81/tcp", ScriptedProbe{milliseconds(5), MakeRefusedOutcome(), false});
  executor.Script("9999/tcp", ScriptedProbe{std::chrono::seconds(10), MakeConnectOutcome(), false});

  probe::ScanSession session(executor, logger);
  probe::ScanRequest request;
  request.target = "example.com";
  request.specs = probe::MakePortScanSpecs({80, 81, 9999}, false);
  request.options = probe::DispatchOptions{.worker_count = 3, .probe_timeout = milliseconds(150)};

  std::size_t callbacks = 0;
  probe::ScanReport report;
  std::string error;
  if (!session.RunScan(std::move(request), [&](const probe::ScanEntry&) { ++callbacks; }, report,
                       error)) {
    Fail("port scan failed to start: " + error);
  }

  Assert(callbacks == 3U, "expected one callback per probe");
  Assert(report.complete, "port scan must be complete");
  Assert(report.present == 1U && report.absent == 2U && report.indeterminate == 0U,
         "unexpected port scan counts");
  const auto verdicts = VerdictsById(report);
  Assert(verdicts.at("80/tcp") == probe::VerdictState::kPresent, "port 80 must be open");
  Assert(verdicts.at("81/tcp") == probe::VerdictState::kAbsent, "port 81 must be closed");
  Assert(verdicts.at("9999/tcp") == probe::VerdictState::kAbsent, "port 9999 must be filtered");
  Assert(session.scans_run() == 1U, "session must count the scan");
}

void RunUsernameSearch(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  executor.Script("GitHub", ScriptedProbe{milliseconds(2), MakeHttpOutcome(200, "<h1>alice</h1>"),
                                          false});
  executor.Script("Twitter", ScriptedProbe{milliseconds(2),
                                           MakeHttpOutcome(200, "This account doesn't exist"),
                                           false});
  executor.Script("Reddit", ScriptedProbe{milliseconds(2), MakeHttpOutcome(404, ""), false});
  executor.Script("Medium", ScriptedProbe{std::chrono::seconds(5), MakeHttpOutcome(200, ""),
                                          false});

  tools::UsernameSearchOptions options;
  options.platforms = {
      {"GitHub", "https://github.com/{}", {"Not Found"}},
      {"Twitter", "https://twitter.com/{}", {"This account doesn't exist"}},
      {"Reddit", "https://www.reddit.com/user/{}", {}},
      {"Medium", "https://medium.com/@{}", {"404"}},
  };
  options.dispatch = probe::DispatchOptions{.worker_count = 4, .probe_timeout = milliseconds(100)};

  probe::ScanSession session(executor, logger);
  probe::ScanReport report;
  std::string error;
  if (!tools::RunUsernameSearch(session, "alice", options, nullptr, report, error)) {
    Fail("username search failed: " + error);
  }
  const auto verdicts = VerdictsById(report);
  Assert(verdicts.at("GitHub") == probe::VerdictState::kPresent, "GitHub must be found");
  Assert(verdicts.at("Twitter") == probe::VerdictState::kAbsent, "marker must mean absent");
  Assert(verdicts.at("Reddit") == probe::VerdictState::kAbsent, "404 must mean absent");
  Assert(verdicts.at("Medium") == probe::VerdictState::kIndeterminate,
         "timeout must be indeterminate");

  const std::size_t calls_before = executor.calls();
  Assert(!tools::RunUsernameSearch(session, "bad/name", options, nullptr, report, error),
         "invalid username must be rejected");
  Assert(executor.calls() == calls_before, "rejected username must not dispatch probes");
}

void RunGeolocationCache(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  probe::ScanSession session(executor, logger);

  std::atomic<int> loads{0};
  session.SetGeolocationLoader([&](const std::string& ip, milliseconds, geo::GeoInfo& info,
                                   std::string& error) {
    loads.fetch_add(1);
    if (ip == "10.0.0.1") {
      error = "private range";
      return false;
    }
    info.ip = ip;
    info.country = "Iceland";
    return true;
  });

  Assert(session.LookupGeolocation("192.0.2.1", milliseconds(100)).has_value(),
         "lookup must succeed");
  Assert(session.LookupGeolocation("192.0.2.1", milliseconds(100))->country == "Iceland",
         "cached value must be returned");
  Assert(loads.load() == 1, "second lookup must be served from the cache");

  Assert(!session.LookupGeolocation("10.0.0.1", milliseconds(100)).has_value(),
         "failed lookup must surface");
  Assert(!session.LookupGeolocation("10.0.0.1", milliseconds(100)).has_value(),
         "failed lookup must surface");
  Assert(loads.load() == 3, "failed lookups must be retried");
}

class RecordingObserver final : public tools::IMonitorObserver {
public:
  void OnPassStarted(std::size_t, std::chrono::system_clock::time_point) override {
    ++passes;
  }
  void OnSnapshot(const tools::ServerInfoSnapshot& snapshot) override {
    ++snapshots;
    last = snapshot;
  }
  void OnPassFailed(const std::string& error) override {
    failures.push_back(error);
  }
  void OnStatus(const tools::MonitorStats&) override {
    ++statuses;
  }
  void OnWaiting(milliseconds) override {
    ++waits;
  }

  int passes = 0;
  int snapshots = 0;
  int statuses = 0;
  int waits = 0;
  std::vector<std::string> failures;
  tools::ServerInfoSnapshot last;
};

// Three passes against localhost with scripted probes: one status report,
// one geolocation fetch, one unique server.
void RunServerMonitor(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  executor.SetDefault(ScriptedProbe{milliseconds(1), MakeRefusedOutcome(), false});
  probe::ProbeOutcome ssh = MakeConnectOutcome();
  ssh.banner = "SSH-2.0-OpenSSH_9.6";
  executor.Script("22/tcp", ScriptedProbe{milliseconds(1), ssh, false});
  executor.Script("80/tcp", ScriptedProbe{milliseconds(1), MakeConnectOutcome(), false});
  probe::ProbeOutcome web = MakeHttpOutcome(200, "");
  web.outcome = probe::OutcomeKind::kSuccessWithStatusOnly;
  web.endpoint = "http://127.0.0.1";
  web.headers = {{"Server", "nginx/1.25"}, {"Content-Type", "text/html"}};
  executor.Script("web", ScriptedProbe{milliseconds(1), web, false});

  probe::ScanSession session(executor, logger);
  int geo_loads = 0;
  session.SetGeolocationLoader([&](const std::string& ip, milliseconds, geo::GeoInfo& info,
                                   std::string&) {
    ++geo_loads;
    info.ip = ip;
    info.country = "Local";
    return true;
  });

  tools::MonitorOptions options;
  options.interval = milliseconds(10);
  options.iterations = 3;
  options.status_every = 3;
  options.info.port_dispatch.probe_timeout = milliseconds(100);
  options.info.web_dispatch.probe_timeout = milliseconds(100);

  RecordingObserver observer;
  tools::MonitorStats stats;
  tools::RunServerMonitor(session, "localhost", options, observer, stats);

  Assert(observer.failures.empty(), "localhost passes must not fail");
  Assert(stats.scan_count == 3U && observer.passes == 3 && observer.snapshots == 3,
         "expected three gathering passes");
  Assert(observer.statuses == 1, "expected one status report");
  Assert(observer.waits == 2, "expected a wait between passes only");
  Assert(stats.failed_scans == 0U, "no pass may fail");
  Assert(stats.unique_servers.size() == 1U, "expected one unique server");
  Assert(geo_loads == 1, "geolocation must be fetched once per address");

  const tools::ServerInfoSnapshot& snapshot = observer.last;
  Assert(snapshot.open_ports.size() == 2U, "expected two open ports");
  Assert(snapshot.open_ports[0].port == 80 && snapshot.open_ports[1].port == 22,
         "open ports must follow scan-table order");
  Assert(snapshot.open_ports[1].service == "SSH", "port 22 must be labelled SSH");
  Assert(snapshot.open_ports[1].banner == "SSH-2.0-OpenSSH_9.6", "banner must be kept");
  Assert(snapshot.web.has_value(), "web server info expected");
  Assert(snapshot.web->protocol == "HTTP" && snapshot.web->server == "nginx/1.25",
         "unexpected web server info");
  Assert(snapshot.geolocation.has_value() && snapshot.geolocation->country == "Local",
         "geolocation must come from the loader");
}

void RunUnresolvableMonitorPass(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  probe::ScanSession session(executor, logger);

  tools::MonitorOptions options;
  options.interval = milliseconds(1);
  options.iterations = 1;

  RecordingObserver observer;
  tools::MonitorStats stats;
  tools::RunServerMonitor(session, "unresolvable.invalid", options, observer, stats);
  Assert(stats.failed_scans == 1U && stats.scan_count == 1U, "failed pass must be counted");
  Assert(observer.failures.size() == 1U, "observer must see the failure");
  AssertContains(observer.failures.front(), "DNS resolution failed");
  Assert(executor.calls() == 0U, "no probes for an unresolvable host");
}

void RunHiddenPaths(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  executor.SetDefault(ScriptedProbe{milliseconds(1), MakeHttpOutcome(404, ""), false});
  probe::ProbeOutcome admin = MakeHttpOutcome(200, std::string(1'234, 'x'));
  admin.endpoint = "http://example.com/admin";
  executor.Script("admin", ScriptedProbe{milliseconds(20), admin, false});
  probe::ProbeOutcome git = MakeHttpOutcome(403, "");
  git.endpoint = "http://example.com/.git";
  executor.Script(".git", ScriptedProbe{milliseconds(1), git, false});

  probe::ScanSession session(executor, logger);
  tools::ReconTarget target;
  std::string error;
  if (!tools::PrepareReconTarget("example.com", target, error)) {
    Fail("target preparation failed: " + error);
  }

  tools::ReconOptions options;
  options.path_dispatch.probe_timeout = milliseconds(200);
  probe::ScanReport report;
  if (!tools::FindHiddenPaths(session, target, options, nullptr, report, error)) {
    Fail("hidden path scan failed: " + error);
  }
  Assert(report.received() == tools::HiddenPaths().size(), "every path must be probed");

  const auto hits = tools::CollectHiddenPathHits(report);
  Assert(hits.size() == 2U, "expected two hidden path hits");
  Assert(hits[0].url == "http://example.com/admin" && hits[0].status_code == 200 &&
             hits[0].size_bytes == 1'234U,
         "admin hit must come first with its size");
  Assert(hits[1].url == "http://example.com/.git" && hits[1].status_code == 403,
         "forbidden .git must count as a hit");
}

void RunServerDetails(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  probe::ProbeOutcome page = MakeHttpOutcome(200, "");
  page.outcome = probe::OutcomeKind::kSuccessWithStatusOnly;
  page.headers = {{"server", "Apache/2.4"},
                  {"X-Powered-By", "PHP/8.3"},
                  {"Content-Type", "text/html"},
                  {"Set-Cookie", "a=b"}};
  executor.Script("server", ScriptedProbe{milliseconds(1), page, false});

  probe::ScanSession session(executor, logger);
  tools::ReconTarget target;
  std::string error;
  if (!tools::PrepareReconTarget("http://localhost/", target, error)) {
    Fail("target preparation failed: " + error);
  }

  const tools::ServerDetails details = tools::GatherServerDetails(session, target, {});
  Assert(details.error.empty(), "server details must succeed: " + details.error);
  Assert(!details.ip.empty(), "localhost must resolve");
  Assert(details.status_code.value_or(0) == 200, "status must be recorded");
  Assert(details.server == "Apache/2.4", "server header lookup must ignore case");
  Assert(details.headers.size() == 2U && details.headers[0].first == "X-Powered-By" &&
             details.headers[1].first == "Content-Type",
         "only interesting headers, in display order");
}

// The recon port scan connects to the address resolved up front, never to the
// hostname, so no worker blocks in the resolver.
void RunReconPortsUseResolvedAddress(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  executor.Script("80/tcp", ScriptedProbe{milliseconds(1), MakeConnectOutcome(), false});
  executor.SetDefault(ScriptedProbe{milliseconds(1), MakeRefusedOutcome(), false});
  probe::ScanSession session(executor, logger);

  tools::ReconTarget target;
  std::string error;
  if (!tools::PrepareReconTarget("http://localhost:8080/", target, error)) {
    Fail("target preparation failed: " + error);
  }

  tools::ReconOptions options;
  options.ports = {22, 80, 443};
  options.port_dispatch.probe_timeout = milliseconds(200);
  probe::ScanReport report;
  const bool unresolved_ok =
      tools::ScanReconPorts(session, target, options, nullptr, report, error);
  Assert(!unresolved_ok, "an unresolved target must not be scanned");
  AssertContains(error, "no resolved address for localhost");
  Assert(executor.calls() == 0U, "no probes before resolution");

  if (!tools::ResolveReconTarget(target, error)) {
    Fail("localhost must resolve: " + error);
  }
  Assert(target.address == "127.0.0.1" || target.address == "::1",
         "localhost must resolve to a loopback address, got " + target.address);

  if (!tools::ScanReconPorts(session, target, options, nullptr, report, error)) {
    Fail("recon port scan failed: " + error);
  }
  Assert(report.received() == 3U && report.present == 1U, "expected one open port of three");
  const std::set<std::string> targets = executor.targets();
  Assert(targets.size() == 1U && *targets.begin() == target.address,
         "every port probe must target the resolved address");

  const tools::ServerDetails details = tools::GatherServerDetails(session, target, options);
  Assert(details.ip == target.address, "server details must reuse the resolved address");
}

void RunCancelledSession(reconkit::core::logging::Logger& logger) {
  ScriptedProbeExecutor executor;
  probe::ScanSession session(executor, logger);
  session.Cancel();

  probe::ScanRequest request;
  request.target = "example.com";
  request.specs = probe::MakePortScanSpecs({22, 80}, false);
  probe::ScanReport report;
  std::string error;
  if (!session.RunScan(std::move(request), nullptr, report, error)) {
    Fail("cancelled scan must still start: " + error);
  }
  Assert(report.finalized && !report.complete, "cancelled scan must be final and incomplete");
  Assert(report.received() == 0U, "nothing may be delivered after cancellation");
}

} // namespace

int main() {
  std::ostringstream log_sink;
  reconkit::core::logging::Logger logger(reconkit::core::logging::LogLevel::kDebug, log_sink);

  RunPortScan(logger);
  RunUsernameSearch(logger);
  RunGeolocationCache(logger);
  RunServerMonitor(logger);
  RunUnresolvableMonitorPass(logger);
  RunHiddenPaths(logger);
  RunServerDetails(logger);
  RunReconPortsUseResolvedAddress(logger);
  RunCancelledSession(logger);

  AssertContains(log_sink.str(), "msg=\"scan finished\"");
  return 0;
}
