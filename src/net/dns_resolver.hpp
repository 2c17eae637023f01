#pragma once

#include <optional>
#include <string>
#include <vector>

namespace reconkit::net {

// Forward-resolution view of one hostname.
struct HostResolution {
  std::string hostname;
  // First IPv4 address when one exists, otherwise the first address returned.
  std::string primary_ip;
  // Unique numeric addresses in resolver order.
  std::vector<std::string> all_ips;
  // Only set when the resolver reports a canonical name different from
  // `hostname`.
  std::optional<std::string> canonical_name;
};

// Resolves `hostname` through the system resolver (getaddrinfo).
bool ResolveHost(const std::string& hostname, HostResolution& resolution, std::string& error);

// PTR lookup for a numeric address. Returns nullopt when no name is
// registered; `error` carries the resolver message in that case.
std::optional<std::string> ReverseLookup(const std::string& ip, std::string& error);

} // namespace reconkit::net
