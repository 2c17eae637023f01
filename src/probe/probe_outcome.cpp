#include "probe/probe_outcome.hpp"

#include <utility>

namespace reconkit::probe {

const char* ToString(OutcomeKind kind) {
  switch (kind) {
  case OutcomeKind::kSuccessWithBody:
    return "success_with_body";
  case OutcomeKind::kSuccessWithStatusOnly:
    return "success_with_status_only";
  case OutcomeKind::kConnectSuccess:
    return "connect_success";
  case OutcomeKind::kConnectFailure:
    return "connect_failure";
  case OutcomeKind::kTimeout:
    return "timeout";
  case OutcomeKind::kNetworkError:
    return "network_error";
  }
  return "network_error";
}

const char* ToString(FailureCategory category) {
  switch (category) {
  case FailureCategory::kNone:
    return "none";
  case FailureCategory::kDnsResolution:
    return "dns_resolution_failure";
  case FailureCategory::kConnectionRefused:
    return "connection_refused";
  case FailureCategory::kConnectionTimeout:
    return "connection_timeout";
  case FailureCategory::kTransport:
    return "transport_error";
  case FailureCategory::kMalformedTarget:
    return "malformed_target";
  case FailureCategory::kCancelled:
    return "cancelled";
  }
  return "transport_error";
}

FailureCategory ToFailureCategory(net::TransportFailure failure) {
  switch (failure) {
  case net::TransportFailure::kNone:
    return FailureCategory::kNone;
  case net::TransportFailure::kMalformedUrl:
    return FailureCategory::kMalformedTarget;
  case net::TransportFailure::kDnsResolution:
    return FailureCategory::kDnsResolution;
  case net::TransportFailure::kConnectionRefused:
    return FailureCategory::kConnectionRefused;
  case net::TransportFailure::kTimeout:
    return FailureCategory::kConnectionTimeout;
  case net::TransportFailure::kTransport:
    return FailureCategory::kTransport;
  case net::TransportFailure::kCancelled:
    return FailureCategory::kCancelled;
  }
  return FailureCategory::kTransport;
}

ProbeOutcome MakeFailureOutcome(net::TransportFailure failure, std::string endpoint,
                                std::string error) {
  ProbeOutcome outcome;
  outcome.failure = ToFailureCategory(failure);
  switch (outcome.failure) {
  case FailureCategory::kConnectionRefused:
    outcome.outcome = OutcomeKind::kConnectFailure;
    break;
  case FailureCategory::kConnectionTimeout:
    outcome.outcome = OutcomeKind::kTimeout;
    break;
  default:
    outcome.outcome = OutcomeKind::kNetworkError;
    break;
  }
  outcome.endpoint = std::move(endpoint);
  outcome.error = std::move(error);
  return outcome;
}

ProbeOutcome MakeMalformedTargetOutcome(std::string endpoint, std::string error) {
  return MakeFailureOutcome(net::TransportFailure::kMalformedUrl, std::move(endpoint),
                            std::move(error));
}

} // namespace reconkit::probe
