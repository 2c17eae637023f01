#pragma once

#include "probe/probe_outcome.hpp"
#include "probe/verdict.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace reconkit::probe {

// One delivered probe: the raw outcome and the verdict derived from it.
struct ScanEntry {
  ProbeOutcome outcome;
  Verdict verdict;
};

// Summary of one scan. `complete` is true only when every submitted spec
// delivered a verdict; a cancelled scan finalizes with what it has.
struct ScanReport {
  std::string target;
  std::vector<ScanEntry> entries;
  std::size_t submitted = 0;
  std::size_t present = 0;
  std::size_t absent = 0;
  std::size_t indeterminate = 0;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::nanoseconds duration{0};
  bool complete = false;
  bool finalized = false;

  std::size_t received() const {
    return entries.size();
  }
};

// Collects verdicts for one scan. Safe to feed from several threads; entries
// keep arrival order.
class ResultAggregator {
public:
  ResultAggregator(std::string target, std::size_t expected);

  ResultAggregator(const ResultAggregator&) = delete;
  ResultAggregator& operator=(const ResultAggregator&) = delete;

  // Rejects an entry for an index already seen, an index outside the scan, or
  // any add after finalization. Finalizes automatically on the last expected
  // entry.
  bool Add(ProbeOutcome outcome, Verdict verdict, std::string& error);

  // Freezes the report. Marks it incomplete when fewer than `expected`
  // verdicts arrived. Idempotent.
  void Finalize();

  bool IsFinalized() const;
  ScanReport Snapshot() const;

private:
  void FinalizeLocked();

  mutable std::mutex mu_;
  ScanReport report_;
  std::vector<bool> seen_;
  std::chrono::steady_clock::time_point started_;
};

} // namespace reconkit::probe
