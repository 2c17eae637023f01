#pragma once

#include "probe/dispatcher.hpp"
#include "probe/probe_spec.hpp"
#include "probe/scan_session.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace reconkit::tools {

// One platform of the username catalog. `url_template` carries a `{}`
// placeholder for the username; any absence marker in a 200 page means the
// account does not exist.
struct PlatformEntry {
  std::string name;
  std::string url_template;
  std::vector<std::string> absence_markers;
};

// Built-in platform table.
const std::vector<PlatformEntry>& DefaultPlatformCatalog();

// Parses a catalog document:
//   {"platforms": [{"name": "...", "url": "https://x/{}", "markers": ["..."]}]}
// Names must be unique and non-empty, URLs must contain `{}`, markers must be
// non-empty strings (an empty marker list is allowed).
bool ParsePlatformCatalog(std::string_view json, std::vector<PlatformEntry>& platforms,
                          std::string& error);

bool LoadPlatformCatalogFile(const std::filesystem::path& path,
                             std::vector<PlatformEntry>& platforms, std::string& error);

// One HTTP-existence probe per platform, in catalog order.
std::vector<probe::ProbeSpec> BuildUsernameProbeSpecs(const std::vector<PlatformEntry>& platforms);

struct UsernameSearchOptions {
  std::vector<PlatformEntry> platforms = DefaultPlatformCatalog();
  probe::DispatchOptions dispatch{.worker_count = 10,
                                  .probe_timeout = std::chrono::milliseconds(10'000)};
};

// Checks `username` against every platform. Rejects usernames that cannot be
// substituted into a URL path before anything is dispatched.
bool RunUsernameSearch(probe::ScanSession& session, const std::string& username,
                       const UsernameSearchOptions& options,
                       const probe::ScanEntryCallback& on_entry, probe::ScanReport& report,
                       std::string& error);

} // namespace reconkit::tools
