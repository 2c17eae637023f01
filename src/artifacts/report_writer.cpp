#include "artifacts/report_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace reconkit::artifacts {

namespace {

const char* BoolText(bool value) {
  return value ? "true" : "false";
}

} // namespace

std::string ToJson(const probe::ScanEntry& entry) {
  const probe::ProbeOutcome& outcome = entry.outcome;
  std::ostringstream out;
  out << "{"
      << "\"index\":" << entry.verdict.spec_index << ","
      << "\"id\":" << core::QuoteJson(entry.verdict.spec_id) << ","
      << "\"kind\":" << core::QuoteJson(probe::ToString(entry.verdict.kind)) << ","
      << "\"verdict\":" << core::QuoteJson(probe::ToString(entry.verdict.state)) << ","
      << "\"reason\":" << core::QuoteJson(entry.verdict.reason) << ","
      << "\"outcome\":" << core::QuoteJson(probe::ToString(outcome.outcome)) << ","
      << "\"failure\":" << core::QuoteJson(probe::ToString(outcome.failure)) << ","
      << "\"elapsed_ms\":" << core::ToMilliseconds(outcome.elapsed) << ","
      << "\"endpoint\":" << core::QuoteJson(outcome.endpoint);
  if (outcome.status_code.has_value()) {
    out << ",\"status_code\":" << *outcome.status_code;
  }
  if (outcome.body_bytes > 0U) {
    out << ",\"body_bytes\":" << outcome.body_bytes;
  }
  if (!outcome.banner.empty()) {
    out << ",\"banner\":" << core::QuoteJson(outcome.banner);
  }
  if (!outcome.peer_address.empty()) {
    out << ",\"peer_address\":" << core::QuoteJson(outcome.peer_address);
  }
  if (!outcome.headers.empty()) {
    out << ",\"headers\":[";
    for (std::size_t i = 0; i < outcome.headers.size(); ++i) {
      if (i > 0U) {
        out << ",";
      }
      out << "[" << core::QuoteJson(outcome.headers[i].first) << ","
          << core::QuoteJson(outcome.headers[i].second) << "]";
    }
    out << "]";
  }
  if (!outcome.error.empty()) {
    out << ",\"error\":" << core::QuoteJson(outcome.error);
  }
  out << "}";
  return out.str();
}

std::string ToJson(const probe::ScanReport& report) {
  std::ostringstream out;
  out << "{"
      << "\"target\":" << core::QuoteJson(report.target) << ","
      << "\"started_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(report.started_at))
      << ","
      << "\"duration_ms\":" << core::ToMilliseconds(report.duration) << ","
      << "\"submitted\":" << report.submitted << ","
      << "\"received\":" << report.received() << ","
      << "\"present\":" << report.present << ","
      << "\"absent\":" << report.absent << ","
      << "\"indeterminate\":" << report.indeterminate << ","
      << "\"complete\":" << BoolText(report.complete) << ","
      << "\"entries\":[";
  for (std::size_t i = 0; i < report.entries.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << ToJson(report.entries[i]);
  }
  out << "]}";
  return out.str();
}

std::string ToJson(const ReportExport& report) {
  std::ostringstream out;
  out << "{"
      << "\"tool\":" << core::QuoteJson(report.tool) << ","
      << "\"target\":" << core::QuoteJson(report.target) << ","
      << "\"generated_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(report.generated_at))
      << ","
      << "\"scans\":{";
  for (std::size_t i = 0; i < report.sections.size(); ++i) {
    if (i > 0U) {
      out << ",";
    }
    out << core::QuoteJson(report.sections[i].first) << ":" << ToJson(report.sections[i].second);
  }
  out << "}}";
  return out.str();
}

bool WriteReportJson(const ReportExport& report, const std::filesystem::path& output_path,
                     std::string& error) {
  // Trailing newline keeps the file shell-friendly (`cat`, diffs).
  return core::WriteTextFileAtomic(output_path, ToJson(report) + "\n", error);
}

} // namespace reconkit::artifacts
