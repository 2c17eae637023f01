#include "tools/port_catalog.hpp"

#include <array>
#include <cstdint>
#include <map>

#include <arpa/inet.h>
#include <netdb.h>

namespace reconkit::tools {

const std::vector<int>& InfoGathererPorts() {
  static const std::vector<int> kPorts = {80, 443, 22, 21, 25, 53, 110, 143, 993, 995};
  return kPorts;
}

const std::vector<int>& ReconPorts() {
  static const std::vector<int> kPorts = {21,  22,  23,   25,   53,   80,   110,  443,
                                          993, 995, 1723, 3306, 3389, 5900, 8080, 8443};
  return kPorts;
}

std::string ServiceName(int port) {
  static const std::map<int, std::string> kKnownServices = {
      {20, "FTP Data"}, {21, "FTP"},    {22, "SSH"},     {23, "Telnet"},   {25, "SMTP"},
      {53, "DNS"},      {80, "HTTP"},   {110, "POP3"},   {143, "IMAP"},    {443, "HTTPS"},
      {993, "IMAPS"},   {995, "POP3S"}, {3306, "MySQL"}, {3389, "RDP"},    {5432, "PostgreSQL"},
  };

  const auto known = kKnownServices.find(port);
  if (known != kKnownServices.end()) {
    return known->second;
  }
  if (port <= 0 || port > 65535) {
    return "Unknown";
  }

  // getservbyport is not reentrant; probe workers may render concurrently.
  servent entry{};
  servent* found = nullptr;
  std::array<char, 1024> buffer{};
  const int rc = getservbyport_r(htons(static_cast<std::uint16_t>(port)), "tcp", &entry,
                                 buffer.data(), buffer.size(), &found);
  if (rc == 0 && found != nullptr && found->s_name != nullptr) {
    return found->s_name;
  }
  return "Unknown";
}

} // namespace reconkit::tools
