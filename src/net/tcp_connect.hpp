#pragma once

#include "core/cancellation.hpp"
#include "net/http_client.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace reconkit::net {

struct TcpConnectRequest {
  std::string host;
  int port = 0;
  // Hard deadline covering connect and, when enabled, the banner read.
  std::chrono::milliseconds timeout{2'000};
  bool capture_banner = false;
  std::size_t max_banner_bytes = 1024;
};

struct TcpConnectResult {
  TransportFailure failure = TransportFailure::kNone;
  std::string error;
  // Numeric address of the endpoint that accepted (or last refused) the connect.
  std::string peer_address;
  // Printable first line of whatever the service sent, at most 200 chars.
  std::string banner;

  bool connected() const {
    return failure == TransportFailure::kNone;
  }
};

// Bytes written after connect to coax a banner out of a service, or empty when
// the service speaks first.
std::string_view BannerProbeFor(int port);

// Reduces raw service bytes to one printable, trimmed line.
std::string SanitizeBanner(std::string_view raw, std::size_t max_chars = 200);

// Non-blocking connect with poll-based deadline across every resolved address
// of `host`. The socket is always closed before returning; cancellation is
// observed within one poll slice.
TcpConnectResult TcpConnect(const TcpConnectRequest& request,
                            const core::CancellationToken* cancel);

} // namespace reconkit::net
