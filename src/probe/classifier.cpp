#include "probe/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <variant>

namespace reconkit::probe {

namespace {

std::string FoldCase(std::string_view text) {
  std::string folded(text);
  std::transform(folded.begin(), folded.end(), folded.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return folded;
}

std::string FailureReason(const ProbeOutcome& outcome) {
  std::string reason = ToString(outcome.failure);
  if (!outcome.error.empty()) {
    reason += ": " + outcome.error;
  }
  return reason;
}

bool GotResponse(const ProbeOutcome& outcome) {
  return (outcome.outcome == OutcomeKind::kSuccessWithBody ||
          outcome.outcome == OutcomeKind::kSuccessWithStatusOnly) &&
         outcome.status_code.has_value();
}

Verdict MakeVerdict(const ProbeSpec& spec, const ProbeOutcome& outcome, VerdictState state,
                    std::string reason) {
  return Verdict{
      .spec_index = outcome.spec_index,
      .spec_id = spec.id,
      .kind = spec.kind(),
      .state = state,
      .reason = std::move(reason),
  };
}

Verdict ClassifyHttpExistence(const ProbeSpec& spec, const HttpExistenceParams& params,
                              const ProbeOutcome& outcome) {
  if (!GotResponse(outcome)) {
    return MakeVerdict(spec, outcome, VerdictState::kIndeterminate, FailureReason(outcome));
  }

  const long status = *outcome.status_code;
  if (status != 200) {
    return MakeVerdict(spec, outcome, VerdictState::kAbsent, "status " + std::to_string(status));
  }

  const auto marker = FindAbsenceMarker(outcome.body, params.absence_markers);
  if (marker.has_value()) {
    return MakeVerdict(spec, outcome, VerdictState::kAbsent,
                       "absence marker matched: \"" + *marker + "\"");
  }
  return MakeVerdict(spec, outcome, VerdictState::kPresent, "status 200, no absence marker");
}

Verdict ClassifyTcpConnect(const ProbeSpec& spec, const ProbeOutcome& outcome) {
  switch (outcome.failure) {
  case FailureCategory::kNone:
    if (outcome.outcome == OutcomeKind::kConnectSuccess) {
      return MakeVerdict(spec, outcome, VerdictState::kPresent, "open");
    }
    break;
  case FailureCategory::kConnectionRefused:
    return MakeVerdict(spec, outcome, VerdictState::kAbsent, "closed (connection refused)");
  case FailureCategory::kConnectionTimeout:
    return MakeVerdict(spec, outcome, VerdictState::kAbsent, "filtered (connect timed out)");
  case FailureCategory::kTransport:
    return MakeVerdict(spec, outcome, VerdictState::kAbsent, "filtered (" + outcome.error + ")");
  default:
    break;
  }
  return MakeVerdict(spec, outcome, VerdictState::kIndeterminate, FailureReason(outcome));
}

Verdict ClassifyHeaderFetch(const ProbeSpec& spec, const ProbeOutcome& outcome) {
  if (!GotResponse(outcome)) {
    return MakeVerdict(spec, outcome, VerdictState::kIndeterminate, FailureReason(outcome));
  }
  return MakeVerdict(spec, outcome, VerdictState::kPresent,
                     "responded with status " + std::to_string(*outcome.status_code));
}

Verdict ClassifyPathProbe(const ProbeSpec& spec, const ProbeOutcome& outcome) {
  if (!GotResponse(outcome)) {
    return MakeVerdict(spec, outcome, VerdictState::kAbsent, FailureReason(outcome));
  }
  const long status = *outcome.status_code;
  if (IsPathProbeHit(status)) {
    return MakeVerdict(spec, outcome, VerdictState::kPresent, "status " + std::to_string(status));
  }
  return MakeVerdict(spec, outcome, VerdictState::kAbsent, "status " + std::to_string(status));
}

} // namespace

bool IsPathProbeHit(long status_code) {
  return status_code == 200 || status_code == 301 || status_code == 302 || status_code == 403;
}

std::optional<std::string> FindAbsenceMarker(std::string_view body,
                                             const std::vector<std::string>& markers) {
  if (markers.empty()) {
    return std::nullopt;
  }
  const std::string folded_body = FoldCase(body);
  for (const auto& marker : markers) {
    if (folded_body.find(FoldCase(marker)) != std::string::npos) {
      return marker;
    }
  }
  return std::nullopt;
}

Verdict Classify(const ProbeSpec& spec, const ProbeOutcome& outcome) {
  if (outcome.failure == FailureCategory::kMalformedTarget) {
    return MakeVerdict(spec, outcome, VerdictState::kIndeterminate, FailureReason(outcome));
  }

  switch (spec.kind()) {
  case ProbeKind::kHttpExistence:
    return ClassifyHttpExistence(spec, std::get<HttpExistenceParams>(spec.params), outcome);
  case ProbeKind::kTcpConnect:
    return ClassifyTcpConnect(spec, outcome);
  case ProbeKind::kHttpHeaderFetch:
    return ClassifyHeaderFetch(spec, outcome);
  case ProbeKind::kPathProbe:
    return ClassifyPathProbe(spec, outcome);
  }
  return MakeVerdict(spec, outcome, VerdictState::kIndeterminate, "unknown probe kind");
}

} // namespace reconkit::probe
