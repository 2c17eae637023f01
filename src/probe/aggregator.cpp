#include "probe/aggregator.hpp"

#include <utility>

namespace reconkit::probe {

ResultAggregator::ResultAggregator(std::string target, std::size_t expected)
    : seen_(expected, false), started_(std::chrono::steady_clock::now()) {
  report_.target = std::move(target);
  report_.submitted = expected;
  report_.started_at = std::chrono::system_clock::now();
  report_.entries.reserve(expected);
  if (expected == 0U) {
    FinalizeLocked();
  }
}

bool ResultAggregator::Add(ProbeOutcome outcome, Verdict verdict, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (report_.finalized) {
    error = "scan report is already finalized";
    return false;
  }
  if (verdict.spec_index >= seen_.size()) {
    error = "verdict index " + std::to_string(verdict.spec_index) + " is outside the scan (" +
            std::to_string(seen_.size()) + " probes)";
    return false;
  }
  if (seen_[verdict.spec_index]) {
    error = "duplicate verdict for probe '" + verdict.spec_id + "'";
    return false;
  }

  seen_[verdict.spec_index] = true;
  switch (verdict.state) {
  case VerdictState::kPresent:
    ++report_.present;
    break;
  case VerdictState::kAbsent:
    ++report_.absent;
    break;
  case VerdictState::kIndeterminate:
    ++report_.indeterminate;
    break;
  }
  report_.entries.push_back(ScanEntry{std::move(outcome), std::move(verdict)});

  if (report_.entries.size() == report_.submitted) {
    FinalizeLocked();
  }
  return true;
}

void ResultAggregator::Finalize() {
  std::lock_guard<std::mutex> lock(mu_);
  FinalizeLocked();
}

bool ResultAggregator::IsFinalized() const {
  std::lock_guard<std::mutex> lock(mu_);
  return report_.finalized;
}

ScanReport ResultAggregator::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  ScanReport copy = report_;
  if (!copy.finalized) {
    copy.duration = std::chrono::steady_clock::now() - started_;
  }
  return copy;
}

void ResultAggregator::FinalizeLocked() {
  if (report_.finalized) {
    return;
  }
  report_.finalized = true;
  report_.complete = report_.entries.size() == report_.submitted;
  report_.duration = std::chrono::steady_clock::now() - started_;
}

} // namespace reconkit::probe
