#include "net/tcp_connect.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>

namespace reconkit::net {

namespace {

using Clock = std::chrono::steady_clock;

class ScopedFd {
public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

private:
  int fd_ = -1;
};

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    freeaddrinfo(info);
  }
};

using AddrInfoList = std::unique_ptr<addrinfo, AddrInfoDeleter>;

enum class WaitResult {
  kReady,
  kDeadline,
  kCancelled,
  kError,
};

// Polls `fd` for `events` until ready, the deadline passes, or cancellation.
WaitResult WaitForFd(int fd, short events, Clock::time_point deadline,
                     const core::CancellationToken* cancel) {
  while (true) {
    if (cancel != nullptr && cancel->IsCancelled()) {
      return WaitResult::kCancelled;
    }
    const auto now = Clock::now();
    if (now >= deadline) {
      return WaitResult::kDeadline;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    const auto slice = std::max(std::chrono::milliseconds(1),
                                std::min(remaining, core::CancellationToken::kPollSlice));

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    const int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
    if (rc > 0) {
      return WaitResult::kReady;
    }
    if (rc < 0 && errno != EINTR) {
      return WaitResult::kError;
    }
  }
}

std::string NumericAddress(const sockaddr* addr, socklen_t len) {
  char host[NI_MAXHOST] = {0};
  if (getnameinfo(addr, len, host, sizeof(host), nullptr, 0, NI_NUMERICHOST) != 0) {
    return "";
  }
  return host;
}

void ReadBanner(int fd, int port, Clock::time_point deadline, std::size_t max_bytes,
                const core::CancellationToken* cancel, std::string& banner) {
  const std::string_view probe = BannerProbeFor(port);
  if (!probe.empty()) {
    (void)::send(fd, probe.data(), probe.size(), MSG_NOSIGNAL);
  }

  if (WaitForFd(fd, POLLIN, deadline, cancel) != WaitResult::kReady) {
    return;
  }

  std::string raw(max_bytes, '\0');
  const ssize_t n = ::recv(fd, raw.data(), raw.size(), 0);
  if (n <= 0) {
    return;
  }
  raw.resize(static_cast<std::size_t>(n));
  banner = SanitizeBanner(raw);
}

} // namespace

std::string_view BannerProbeFor(int port) {
  switch (port) {
  case 80:
  case 443:
    return "HEAD / HTTP/1.0\r\n\r\n";
  case 22:
    return "SSH-2.0-Client\r\n";
  default:
    return {};
  }
}

std::string SanitizeBanner(std::string_view raw, std::size_t max_chars) {
  std::string cleaned;
  cleaned.reserve(std::min(raw.size(), max_chars));
  for (const char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == '\n') {
      if (!cleaned.empty()) {
        break;
      }
      continue;
    }
    if (c == '\r') {
      continue;
    }
    if (std::isprint(uc) != 0 || c == '\t') {
      cleaned.push_back(c);
    }
  }

  std::size_t start = 0;
  while (start < cleaned.size() &&
         std::isspace(static_cast<unsigned char>(cleaned[start])) != 0) {
    ++start;
  }
  std::size_t end = cleaned.size();
  while (end > start && std::isspace(static_cast<unsigned char>(cleaned[end - 1U])) != 0) {
    --end;
  }
  cleaned = cleaned.substr(start, end - start);
  if (cleaned.size() > max_chars) {
    cleaned.resize(max_chars);
  }
  return cleaned;
}

TcpConnectResult TcpConnect(const TcpConnectRequest& request,
                            const core::CancellationToken* cancel) {
  TcpConnectResult result;
  const auto deadline = Clock::now() + request.timeout;

  if (request.host.empty()) {
    result.failure = TransportFailure::kMalformedUrl;
    result.error = "empty host";
    return result;
  }
  if (request.port < 1 || request.port > 65535) {
    result.failure = TransportFailure::kMalformedUrl;
    result.error = "port out of range: " + std::to_string(request.port);
    return result;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* raw_list = nullptr;
  const std::string port_text = std::to_string(request.port);
  const int gai_rc = getaddrinfo(request.host.c_str(), port_text.c_str(), &hints, &raw_list);
  AddrInfoList addresses(raw_list);
  if (gai_rc != 0) {
    result.failure = TransportFailure::kDnsResolution;
    result.error = std::string("DNS resolution failed: ") + gai_strerror(gai_rc);
    return result;
  }

  TransportFailure last_failure = TransportFailure::kTransport;
  std::string last_error = "no usable address";

  for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    if (cancel != nullptr && cancel->IsCancelled()) {
      result.failure = TransportFailure::kCancelled;
      result.error = "cancelled";
      return result;
    }
    if (Clock::now() >= deadline) {
      last_failure = TransportFailure::kTimeout;
      last_error = "connect timed out";
      break;
    }

    ScopedFd sock(::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol));
    if (sock.get() < 0) {
      last_error = std::string("socket() failed: ") + std::strerror(errno);
      continue;
    }
    const int flags = ::fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
      last_error = std::string("fcntl(O_NONBLOCK) failed: ") + std::strerror(errno);
      continue;
    }

    const std::string peer = NumericAddress(ai->ai_addr, ai->ai_addrlen);
    int connect_errno = 0;
    if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        connect_errno = errno;
      } else {
        const WaitResult waited = WaitForFd(sock.get(), POLLOUT, deadline, cancel);
        if (waited == WaitResult::kCancelled) {
          result.failure = TransportFailure::kCancelled;
          result.error = "cancelled";
          return result;
        }
        if (waited == WaitResult::kDeadline) {
          last_failure = TransportFailure::kTimeout;
          last_error = "connect to " + peer + " timed out";
          result.peer_address = peer;
          break;
        }
        if (waited == WaitResult::kError) {
          connect_errno = errno;
        } else {
          socklen_t len = sizeof(connect_errno);
          if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &connect_errno, &len) != 0) {
            connect_errno = errno;
          }
        }
      }
    }

    if (connect_errno != 0) {
      result.peer_address = peer;
      last_failure = connect_errno == ECONNREFUSED ? TransportFailure::kConnectionRefused
                                                   : TransportFailure::kTransport;
      last_error = "connect to " + peer + " failed: " + std::strerror(connect_errno);
      continue;
    }

    result.failure = TransportFailure::kNone;
    result.error.clear();
    result.peer_address = peer;
    if (request.capture_banner) {
      ReadBanner(sock.get(), request.port, deadline, request.max_banner_bytes, cancel,
                 result.banner);
    }
    return result;
  }

  result.failure = last_failure;
  result.error = last_error;
  return result;
}

} // namespace reconkit::net
