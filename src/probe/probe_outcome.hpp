#pragma once

#include "net/http_client.hpp"
#include "probe/probe_spec.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace reconkit::probe {

// Raw outcome classes of one probe execution.
enum class OutcomeKind {
  kSuccessWithBody,
  kSuccessWithStatusOnly,
  kConnectSuccess,
  kConnectFailure,
  kTimeout,
  kNetworkError,
};

// Error taxonomy carried alongside the outcome kind. `kCancelled` never
// reaches a report; the dispatcher drops abandoned probes.
enum class FailureCategory {
  kNone,
  kDnsResolution,
  kConnectionRefused,
  kConnectionTimeout,
  kTransport,
  kMalformedTarget,
  kCancelled,
};

const char* ToString(OutcomeKind kind);
const char* ToString(FailureCategory category);

struct ProbeOutcome {
  // Identity of the originating spec; filled by the dispatcher.
  std::size_t spec_index = 0;
  std::string spec_id;
  ProbeKind kind = ProbeKind::kTcpConnect;

  OutcomeKind outcome = OutcomeKind::kNetworkError;
  FailureCategory failure = FailureCategory::kNone;
  std::chrono::nanoseconds elapsed{0};

  // URL or host:port actually probed.
  std::string endpoint;
  std::optional<long> status_code;
  net::HttpHeaders headers;
  std::string body;
  std::size_t body_bytes = 0;
  std::string banner;
  std::string peer_address;
  std::string error;
};

// Builds a failure outcome from a transport failure class.
ProbeOutcome MakeFailureOutcome(net::TransportFailure failure, std::string endpoint,
                                std::string error);

// Outcome for a spec whose target could not be turned into an endpoint.
ProbeOutcome MakeMalformedTargetOutcome(std::string endpoint, std::string error);

FailureCategory ToFailureCategory(net::TransportFailure failure);

} // namespace reconkit::probe
