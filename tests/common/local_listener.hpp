#ifndef RECONKIT_TESTS_COMMON_LOCAL_LISTENER_HPP_
#define RECONKIT_TESTS_COMMON_LOCAL_LISTENER_HPP_

#include "assertions.hpp"

#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace reconkit::tests::common {

struct CannedResponse {
  int status = 200;
  std::string body;
};

// Loopback TCP listener on an ephemeral port for network-level tests.
//
// - kSilent accepts connections and never answers (a hung server).
// - kBanner writes `banner` on accept and closes.
// - kHttp answers one request per connection from `routes` (404 otherwise).
class LocalListener {
public:
  enum class Mode {
    kSilent,
    kBanner,
    kHttp,
  };

  explicit LocalListener(Mode mode) : mode_(mode) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
      Fail("failed to create listener socket");
    }
    const int reuse = 1;
    (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_fd_, 64) != 0) {
      Fail("failed to bind loopback listener");
    }
    socklen_t len = sizeof(addr);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      Fail("failed to read listener port");
    }
    port_ = ntohs(addr.sin_port);
  }

  ~LocalListener() {
    stop_.store(true);
    if (thread_.joinable()) {
      thread_.join();
    }
    for (const int fd : held_) {
      ::close(fd);
    }
    ::close(listen_fd_);
  }

  LocalListener(const LocalListener&) = delete;
  LocalListener& operator=(const LocalListener&) = delete;

  void SetBanner(std::string banner) {
    banner_ = std::move(banner);
  }

  void Route(const std::string& path, CannedResponse response) {
    routes_[path] = std::move(response);
  }

  // Routes and banner must be configured before Start.
  void Start() {
    thread_ = std::thread([this] { Serve(); });
  }

  int port() const {
    return port_;
  }

  std::string base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

private:
  void Serve() {
    while (!stop_.load()) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      const int ready = ::poll(&pfd, 1, 50);
      if (ready <= 0) {
        continue;
      }
      const int client = ::accept(listen_fd_, nullptr, nullptr);
      if (client < 0) {
        continue;
      }
      switch (mode_) {
      case Mode::kSilent:
        held_.push_back(client);
        break;
      case Mode::kBanner:
        WriteAll(client, banner_);
        ::close(client);
        break;
      case Mode::kHttp:
        AnswerHttp(client);
        ::close(client);
        break;
      }
    }
  }

  void AnswerHttp(int client) {
    std::string request;
    char buffer[1024];
    while (request.find("\r\n\r\n") == std::string::npos) {
      pollfd pfd{client, POLLIN, 0};
      if (::poll(&pfd, 1, 1'000) <= 0) {
        return;
      }
      const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        return;
      }
      request.append(buffer, static_cast<std::size_t>(n));
    }

    std::string path = "/";
    const std::size_t first_space = request.find(' ');
    const std::size_t second_space = request.find(' ', first_space + 1U);
    if (first_space != std::string::npos && second_space != std::string::npos) {
      path = request.substr(first_space + 1U, second_space - first_space - 1U);
    }

    CannedResponse response{404, "not found"};
    const auto route = routes_.find(path);
    if (route != routes_.end()) {
      response = route->second;
    }
    const std::string head = "HTTP/1.1 " + std::to_string(response.status) + " Canned\r\n" +
                             "Server: reconkit-test\r\n" + "Content-Type: text/plain\r\n" +
                             "Content-Length: " + std::to_string(response.body.size()) + "\r\n" +
                             "Connection: close\r\n\r\n";
    WriteAll(client, head + response.body);
  }

  static void WriteAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
      const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        return;
      }
      sent += static_cast<std::size_t>(n);
    }
  }

  Mode mode_;
  int listen_fd_ = -1;
  int port_ = 0;
  std::string banner_;
  std::map<std::string, CannedResponse> routes_;
  std::vector<int> held_;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

// A loopback port with no listener behind it: connects are refused.
inline int ReserveClosedLoopbackPort() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    Fail("failed to create probe socket");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  socklen_t len = sizeof(addr);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    ::close(fd);
    Fail("failed to reserve loopback port");
  }
  ::close(fd);
  return ntohs(addr.sin_port);
}

} // namespace reconkit::tests::common

#endif // RECONKIT_TESTS_COMMON_LOCAL_LISTENER_HPP_
