#include "net/dns_resolver.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

namespace reconkit::net {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    freeaddrinfo(info);
  }
};

using AddrInfoList = std::unique_ptr<addrinfo, AddrInfoDeleter>;

} // namespace

bool ResolveHost(const std::string& hostname, HostResolution& resolution, std::string& error) {
  resolution = HostResolution{};
  resolution.hostname = hostname;
  if (hostname.empty()) {
    error = "hostname cannot be empty";
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_CANONNAME;
  addrinfo* raw_list = nullptr;
  const int rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &raw_list);
  AddrInfoList addresses(raw_list);
  if (rc != 0) {
    error = "DNS resolution failed: " + std::string(gai_strerror(rc));
    return false;
  }

  std::string first_v4;
  for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
    if (ai->ai_canonname != nullptr && !resolution.canonical_name.has_value() &&
        hostname != ai->ai_canonname) {
      resolution.canonical_name = std::string(ai->ai_canonname);
    }

    char host[NI_MAXHOST] = {0};
    if (getnameinfo(ai->ai_addr, ai->ai_addrlen, host, sizeof(host), nullptr, 0,
                    NI_NUMERICHOST) != 0) {
      continue;
    }
    const std::string ip(host);
    if (std::find(resolution.all_ips.begin(), resolution.all_ips.end(), ip) ==
        resolution.all_ips.end()) {
      resolution.all_ips.push_back(ip);
    }
    if (first_v4.empty() && ai->ai_family == AF_INET) {
      first_v4 = ip;
    }
  }

  if (resolution.all_ips.empty()) {
    error = "DNS resolution returned no usable addresses for " + hostname;
    return false;
  }
  resolution.primary_ip = first_v4.empty() ? resolution.all_ips.front() : first_v4;
  return true;
}

std::optional<std::string> ReverseLookup(const std::string& ip, std::string& error) {
  sockaddr_storage storage{};
  socklen_t len = 0;

  auto* v4 = reinterpret_cast<sockaddr_in*>(&storage);
  auto* v6 = reinterpret_cast<sockaddr_in6*>(&storage);
  if (inet_pton(AF_INET, ip.c_str(), &v4->sin_addr) == 1) {
    v4->sin_family = AF_INET;
    len = sizeof(sockaddr_in);
  } else if (inet_pton(AF_INET6, ip.c_str(), &v6->sin6_addr) == 1) {
    v6->sin6_family = AF_INET6;
    len = sizeof(sockaddr_in6);
  } else {
    error = "not a numeric address: " + ip;
    return std::nullopt;
  }

  char host[NI_MAXHOST] = {0};
  const int rc = getnameinfo(reinterpret_cast<const sockaddr*>(&storage), len, host,
                             sizeof(host), nullptr, 0, NI_NAMEREQD);
  if (rc != 0) {
    error = "reverse lookup failed: " + std::string(gai_strerror(rc));
    return std::nullopt;
  }
  return std::string(host);
}

} // namespace reconkit::net
