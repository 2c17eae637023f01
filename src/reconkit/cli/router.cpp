#include "reconkit/cli/router.hpp"

#include "artifacts/report_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/time_utils.hpp"
#include "net/http_client.hpp"
#include "net/target.hpp"
#include "probe/network_executor.hpp"
#include "probe/scan_session.hpp"
#include "reconkit/cli/console_report.hpp"
#include "reconkit/cli/interrupt_guard.hpp"
#include "tools/server_info.hpp"
#include "tools/server_recon.hpp"
#include "tools/username_search.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reconkit::cli {

namespace {

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInvalidTarget = core::errors::ToInt(core::errors::ExitCode::kInvalidTarget);
constexpr int kExitInterrupted = core::errors::ToInt(core::errors::ExitCode::kInterrupted);

constexpr std::string_view kVersion = "reconkit 0.1.0";

// Upper bounds for numeric flags; larger values overflow the chrono arithmetic downstream.
constexpr std::uint64_t kMaxTimeoutMs = 3'600'000;
constexpr std::uint64_t kMaxIntervalSeconds = 86'400;

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  reconkit user <username> [--platforms <catalog.json>] [common options]\n"
      << "  reconkit info <hostname> [--interval <seconds>] [--iterations <n>] [common options]\n"
      << "  reconkit recon <target> [common options]\n"
      << "  reconkit version\n"
      << "common options:\n"
      << "  --workers <n>          concurrent probes per scan\n"
      << "  --timeout-ms <ms>      per-probe deadline\n"
      << "  --json <path>          write the scan report as JSON\n"
      << "  --log-level <debug|info|warn|error>\n"
      << "only scan hosts you own or are permitted to test\n";
}

void PrintSection(std::ostream& out, std::string_view title) {
  const std::string rule(60, '=');
  out << '\n' << rule << '\n' << title << '\n' << rule << '\n';
}

// Timestamp-based identifier tying log lines of one invocation together.
std::string MakeScanId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "scan-" + std::to_string(millis);
}

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::uint64_t& value,
                   std::string& error) {
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  return true;
}

// Consumes one of the flags shared by every probing subcommand. `handled`
// reports whether `args[i]` was one of them; `i` is advanced past its value.
bool ParseCommonFlag(const std::vector<std::string_view>& args, std::size_t& i,
                     CommonOptions& options, bool& handled, std::string& error) {
  handled = false;
  const std::string_view token = args[i];
  if (token != "--workers" && token != "--timeout-ms" && token != "--json" &&
      token != "--log-level") {
    return true;
  }
  handled = true;
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(token);
    return false;
  }
  const std::string_view value = args[i + 1];
  ++i;

  if (token == "--workers") {
    std::uint64_t workers = 0;
    if (!ParseUnsigned(token, value, workers, error)) {
      return false;
    }
    if (workers == 0U) {
      error = "--workers must be at least 1";
      return false;
    }
    options.workers = static_cast<std::size_t>(workers);
    return true;
  }
  if (token == "--timeout-ms") {
    std::uint64_t timeout_ms = 0;
    if (!ParseUnsigned(token, value, timeout_ms, error)) {
      return false;
    }
    if (timeout_ms == 0U) {
      error = "--timeout-ms must be positive";
      return false;
    }
    if (timeout_ms > kMaxTimeoutMs) {
      error = "--timeout-ms must be at most " + std::to_string(kMaxTimeoutMs);
      return false;
    }
    options.timeout = std::chrono::milliseconds(static_cast<std::int64_t>(timeout_ms));
    return true;
  }
  if (token == "--json") {
    if (value.empty()) {
      error = "--json requires a non-empty path";
      return false;
    }
    options.json_path = std::string(value);
    return true;
  }

  return core::logging::ParseLogLevel(value, options.log_level, error);
}

// Positional target handling shared by the subcommands.
bool AcceptTarget(std::string_view command, std::string_view token, CommonOptions& options,
                  std::string& error) {
  if (!token.empty() && token.front() == '-') {
    error = "unknown option: " + std::string(token);
    return false;
  }
  if (options.target_given) {
    error = std::string(command) + " accepts exactly 1 target";
    return false;
  }
  options.target = std::string(token);
  options.target_given = true;
  return true;
}

void ApplyOverrides(const CommonOptions& options, probe::DispatchOptions& dispatch) {
  if (options.workers.has_value()) {
    dispatch.worker_count = *options.workers;
  }
  if (options.timeout.has_value()) {
    dispatch.probe_timeout = *options.timeout;
  }
}

bool ExportIfRequested(const CommonOptions& options, artifacts::ReportExport report,
                       core::logging::Logger& logger) {
  if (options.json_path.empty()) {
    return true;
  }
  report.generated_at = std::chrono::system_clock::now();
  std::string error;
  if (!artifacts::WriteReportJson(report, options.json_path, error)) {
    logger.Error("failed to write report", {{"path", options.json_path}, {"error", error}});
    std::cerr << "error: failed to write report: " << error << '\n';
    return false;
  }
  logger.Info("report written", {{"path", options.json_path}});
  std::cout << "report: " << options.json_path << '\n';
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << kVersion << '\n';
  return kExitSuccess;
}

struct UserCommandOptions {
  CommonOptions common;
  std::string platforms_path;
};

bool ParseUserOptions(const std::vector<std::string_view>& args, UserCommandOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool handled = false;
    if (!ParseCommonFlag(args, i, options.common, handled, error)) {
      return false;
    }
    if (handled) {
      continue;
    }
    const std::string_view token = args[i];
    if (token == "--platforms") {
      if (i + 1 >= args.size()) {
        error = "missing value for --platforms";
        return false;
      }
      options.platforms_path = std::string(args[i + 1]);
      ++i;
      continue;
    }
    if (!AcceptTarget("user", token, options.common, error)) {
      return false;
    }
  }

  if (!options.common.target_given) {
    error = "user requires exactly 1 argument: <username>";
    return false;
  }
  return true;
}

int CommandUser(const std::vector<std::string_view>& args) {
  UserCommandOptions options;
  std::string error;
  if (!ParseUserOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.common.log_level);
  logger.SetScanId(MakeScanId(std::chrono::system_clock::now()));

  const std::string& username = options.common.target;
  if (!net::ValidateUsername(username, error)) {
    logger.Error("username rejected", {{"username", username}, {"error", error}});
    std::cerr << "error: invalid username: " << error << '\n';
    return kExitInvalidTarget;
  }

  tools::UsernameSearchOptions search;
  if (!options.platforms_path.empty()) {
    if (!tools::LoadPlatformCatalogFile(options.platforms_path, search.platforms, error)) {
      logger.Error("failed to load platform catalog",
                   {{"path", options.platforms_path}, {"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
  }
  ApplyOverrides(options.common, search.dispatch);

  net::EnsureHttpTransportInitialized();
  probe::NetworkProbeExecutor executor;
  probe::ScanSession session(executor, logger);
  InterruptGuard interrupt_guard(session.cancellation());

  std::cout << "[*] Searching for username: " << username << '\n'
            << "[*] Scanning " << search.platforms.size() << " platforms...\n\n";

  probe::ScanReport report;
  const bool ran = tools::RunUsernameSearch(
      session, username, search,
      [](const probe::ScanEntry& entry) { PrintUsernameEntry(std::cout, entry); }, report, error);
  if (!ran) {
    logger.Error("username search failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  std::cout << "\n[+] Scan completed in " << core::FormatSeconds(report.duration) << " seconds\n"
            << "[+] Found " << report.present << " accounts for '" << username << "'\n";
  PrintScanSummary(std::cout, report);

  artifacts::ReportExport exported;
  exported.tool = "user";
  exported.target = username;
  exported.sections.emplace_back("platforms", std::move(report));
  if (!ExportIfRequested(options.common, std::move(exported), logger)) {
    return kExitFailure;
  }

  if (session.cancelled()) {
    std::cerr << "interrupted: partial results shown\n";
    return kExitInterrupted;
  }
  return kExitSuccess;
}

struct InfoCommandOptions {
  CommonOptions common;
  std::chrono::seconds interval = tools::kDefaultMonitorInterval;
  std::size_t iterations = 0;
};

bool ParseInfoOptions(const std::vector<std::string_view>& args, InfoCommandOptions& options,
                      std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool handled = false;
    if (!ParseCommonFlag(args, i, options.common, handled, error)) {
      return false;
    }
    if (handled) {
      continue;
    }
    const std::string_view token = args[i];
    if (token == "--interval" || token == "--iterations") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      std::uint64_t value = 0;
      if (!ParseUnsigned(token, args[i + 1], value, error)) {
        return false;
      }
      if (token == "--interval") {
        if (value > kMaxIntervalSeconds) {
          error = "--interval must be at most " + std::to_string(kMaxIntervalSeconds) + " seconds";
          return false;
        }
        options.interval = std::chrono::seconds(static_cast<std::int64_t>(value));
      } else {
        options.iterations = static_cast<std::size_t>(value);
      }
      ++i;
      continue;
    }
    if (!AcceptTarget("info", token, options.common, error)) {
      return false;
    }
  }

  if (!options.common.target_given) {
    error = "info requires exactly 1 argument: <hostname>";
    return false;
  }
  return true;
}

int CommandInfo(const std::vector<std::string_view>& args) {
  InfoCommandOptions options;
  std::string error;
  if (!ParseInfoOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.common.log_level);
  logger.SetScanId(MakeScanId(std::chrono::system_clock::now()));

  std::string hostname;
  if (!net::NormalizeHostTarget(options.common.target, hostname, error)) {
    logger.Error("hostname rejected", {{"target", options.common.target}, {"error", error}});
    std::cerr << "error: invalid hostname: " << error << '\n';
    return kExitInvalidTarget;
  }

  bool clamped = false;
  tools::MonitorOptions monitor;
  const std::chrono::seconds interval = tools::ClampMonitorInterval(options.interval, clamped);
  if (clamped) {
    std::cerr << "warning: interval too short, using minimum of "
              << tools::kMinimumMonitorInterval.count() << " seconds\n";
  }
  monitor.interval = interval;
  monitor.iterations = options.iterations;
  ApplyOverrides(options.common, monitor.info.port_dispatch);
  if (options.common.timeout.has_value()) {
    monitor.info.web_dispatch.probe_timeout = *options.common.timeout;
  }

  net::EnsureHttpTransportInitialized();
  probe::NetworkProbeExecutor executor;
  probe::ScanSession session(executor, logger);
  InterruptGuard interrupt_guard(session.cancellation());

  std::cout << "Starting continuous monitoring for: " << hostname << '\n'
            << "Update interval: " << interval.count() << " seconds\n"
            << "Press Ctrl+C to stop\n";

  ConsoleMonitorObserver observer(std::cout);
  tools::MonitorStats stats;
  tools::RunServerMonitor(session, hostname, monitor, observer, stats);

  std::cout << '\n' << std::string(60, '=') << '\n'
            << "Server Information Gatherer stopped\n"
            << std::string(60, '=') << '\n';
  PrintMonitorStatus(std::cout, stats, /*running=*/false);
  PrintMonitorSummary(std::cout, stats, session.geo_cache());

  if (const tools::ServerInfoSnapshot* last = observer.last_snapshot(); last != nullptr) {
    artifacts::ReportExport exported;
    exported.tool = "info";
    exported.target = hostname;
    exported.sections.emplace_back("ports", last->port_report);
    exported.sections.emplace_back("web", last->web_report);
    if (!ExportIfRequested(options.common, std::move(exported), logger)) {
      return kExitFailure;
    }
  }

  if (session.cancelled()) {
    return kExitInterrupted;
  }
  if (stats.scan_count > 0U && stats.failed_scans == stats.scan_count) {
    return kExitFailure;
  }
  return kExitSuccess;
}

bool ParseReconOptions(const std::vector<std::string_view>& args, CommonOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    bool handled = false;
    if (!ParseCommonFlag(args, i, options, handled, error)) {
      return false;
    }
    if (handled) {
      continue;
    }
    if (!AcceptTarget("recon", args[i], options, error)) {
      return false;
    }
  }

  if (!options.target_given) {
    error = "recon requires exactly 1 argument: <target>";
    return false;
  }
  return true;
}

int CommandRecon(const std::vector<std::string_view>& args) {
  CommonOptions options;
  std::string error;
  if (!ParseReconOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetScanId(MakeScanId(std::chrono::system_clock::now()));

  tools::ReconTarget target;
  if (!tools::PrepareReconTarget(options.target, target, error)) {
    logger.Error("target rejected", {{"target", options.target}, {"error", error}});
    std::cerr << "error: invalid target: " << error << '\n';
    return kExitInvalidTarget;
  }
  if (target.added_scheme) {
    std::cerr << "warning: added http:// prefix, using: " << target.url << '\n';
  }

  tools::ReconOptions recon;
  ApplyOverrides(options, recon.port_dispatch);
  ApplyOverrides(options, recon.path_dispatch);
  if (options.timeout.has_value()) {
    recon.fetch_timeout = *options.timeout;
  }

  net::EnsureHttpTransportInitialized();
  probe::NetworkProbeExecutor executor;
  probe::ScanSession session(executor, logger);
  InterruptGuard interrupt_guard(session.cancellation());

  const auto started = std::chrono::steady_clock::now();
  std::cout << "[*] Starting reconnaissance on: " << target.url << '\n';

  if (!tools::ResolveReconTarget(target, error)) {
    logger.Warn("target did not resolve", {{"host", target.hostname}, {"error", error}});
  }

  PrintSection(std::cout, "SERVER & DNS INFORMATION");
  PrintServerDetails(std::cout, tools::GatherServerDetails(session, target, recon));

  PrintSection(std::cout, "PORT SCAN RESULTS");
  probe::ScanReport port_report;
  const bool ports_scanned = !target.address.empty();
  if (ports_scanned) {
    std::cout << "[*] Scanning " << recon.ports.size() << " common ports on " << target.hostname
              << " (" << target.address << ")...\n";
    const auto on_port = [&recon](const probe::ScanEntry& entry) {
      PrintPortEntry(std::cout, entry, recon.ports.at(entry.verdict.spec_index));
    };
    if (!tools::ScanReconPorts(session, target, recon, on_port, port_report, error)) {
      logger.Error("port scan failed", {{"error", error}});
      std::cerr << "error: port scan failed: " << error << '\n';
      return kExitFailure;
    }
    if (port_report.present > 0U) {
      std::cout << "[+] Found " << port_report.present << " open ports\n";
    } else {
      std::cout << "[*] No common open ports found.\n";
    }
    PrintScanSummary(std::cout, port_report);
  } else {
    std::cout << "[-] Port scan skipped: " << target.hostname << " did not resolve\n";
  }

  if (!session.cancelled()) {
    PrintSection(std::cout, "ROBOTS.TXT ANALYSIS");
    PrintRobotsReport(std::cout, tools::FetchRobots(session, target, recon));
  }

  PrintSection(std::cout, "HIDDEN PATH DISCOVERY");
  std::cout << "[*] Checking " << recon.paths.size() << " common hidden paths...\n";
  probe::ScanReport path_report;
  const auto on_path = [](const probe::ScanEntry& entry) {
    if (entry.verdict.state == probe::VerdictState::kPresent) {
      PrintPathEntry(std::cout, entry);
    }
  };
  if (!tools::FindHiddenPaths(session, target, recon, on_path, path_report, error)) {
    logger.Error("hidden path discovery failed", {{"error", error}});
    std::cerr << "error: hidden path discovery failed: " << error << '\n';
    return kExitFailure;
  }
  if (path_report.present > 0U) {
    std::cout << "[+] Found " << path_report.present << " accessible hidden paths!\n";
  } else {
    std::cout << "[*] No common hidden paths found.\n";
  }
  PrintScanSummary(std::cout, path_report);

  std::cout << "\n[+] Reconnaissance completed in "
            << core::FormatSeconds(std::chrono::steady_clock::now() - started) << " seconds\n";

  artifacts::ReportExport exported;
  exported.tool = "recon";
  exported.target = target.url;
  if (ports_scanned) {
    exported.sections.emplace_back("ports", std::move(port_report));
  }
  exported.sections.emplace_back("paths", std::move(path_report));
  if (!ExportIfRequested(options, std::move(exported), logger)) {
    return kExitFailure;
  }

  if (session.cancelled()) {
    std::cerr << "interrupted: partial results shown\n";
    return kExitInterrupted;
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "user") {
    return CommandUser(args);
  }

  if (command == "info") {
    return CommandInfo(args);
  }

  if (command == "recon") {
    return CommandRecon(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace reconkit::cli
