#pragma once

#include "probe/aggregator.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace reconkit::artifacts {

// One-shot export of the scans a tool invocation ran. Each section is one
// named scan ("platforms", "ports", "paths", ...).
struct ReportExport {
  std::string tool;
  std::string target;
  std::chrono::system_clock::time_point generated_at{};
  std::vector<std::pair<std::string, probe::ScanReport>> sections;
};

std::string ToJson(const probe::ScanEntry& entry);
std::string ToJson(const probe::ScanReport& report);
std::string ToJson(const ReportExport& report);

// Writes `report` as JSON to `output_path`.
//
// Contract:
// - Creates the parent directory if needed.
// - Publishes atomically (temp file then rename).
// - Returns false on failure and populates `error`.
bool WriteReportJson(const ReportExport& report, const std::filesystem::path& output_path,
                     std::string& error);

} // namespace reconkit::artifacts
