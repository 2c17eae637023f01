#pragma once

#include "core/cancellation.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace reconkit::geo {

// Endpoint template for the ip-api.com JSON API; `{}` is the address.
inline constexpr std::string_view kGeolocationUrlTemplate = "http://ip-api.com/json/{}";

// Subset of the ip-api.com response the tools display.
struct GeoInfo {
  std::string ip;
  std::string country;
  std::string region;
  std::string city;
  std::string isp;
  std::string org;
  std::string as;
};

// Parses an ip-api.com JSON body. Fails when the body is not JSON or its
// `status` member is not "success" (the API reports failures in-band with a
// `message` member).
bool ParseGeolocationResponse(std::string_view json, GeoInfo& info, std::string& error);

// Fetches and parses the geolocation of `ip`.
bool LookupGeolocation(const std::string& ip, std::chrono::milliseconds timeout,
                       const core::CancellationToken& cancel, GeoInfo& info,
                       std::string& error);

} // namespace reconkit::geo
