#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reconkit::net {

// User-Agent sent on every probe request.
inline constexpr std::string_view kDefaultUserAgent =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36";

// Stable transport failure classes. These map one-to-one onto the probe
// failure taxonomy so callers never parse curl error strings.
enum class TransportFailure {
  kNone,
  kMalformedUrl,
  kDnsResolution,
  kConnectionRefused,
  kTimeout,
  kTransport,
  kCancelled,
};

const char* ToString(TransportFailure failure);

struct HttpRequest {
  std::string url;
  // Hard deadline for the whole exchange (connect + transfer).
  std::chrono::milliseconds timeout{5'000};
  bool follow_redirects = false;
  // When false the body is drained and counted but not kept.
  bool capture_body = true;
  std::size_t max_body_bytes = 2U * 1024U * 1024U;
  std::string user_agent = std::string(kDefaultUserAgent);
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
  long status_code = 0;
  // Headers of the final response only (earlier redirect hops are dropped).
  HttpHeaders headers;
  std::string body;
  // Total body bytes received, including bytes beyond `max_body_bytes`.
  std::size_t body_bytes = 0;
  std::string effective_url;
};

struct HttpResult {
  TransportFailure failure = TransportFailure::kNone;
  std::string error;
  HttpResponse response;

  bool ok() const {
    return failure == TransportFailure::kNone;
  }
};

// Case-insensitive header lookup.
std::optional<std::string> FindHeader(const HttpHeaders& headers, std::string_view name);

// Blocking HTTP/HTTPS GET built on a per-call libcurl easy handle, safe to call
// from many worker threads at once. Never throws; every failure is reported
// through `HttpResult::failure`.
//
// When `cancel` is non-null the transfer is aborted at libcurl's next progress
// callback after cancellation (at most about a second) and reported as
// `kCancelled`.
HttpResult HttpGet(const HttpRequest& request, const core::CancellationToken* cancel);

// Process-wide libcurl initialization. Idempotent and thread-safe; HttpGet
// calls it implicitly, the CLI calls it up front before spawning workers.
void EnsureHttpTransportInitialized();

} // namespace reconkit::net
