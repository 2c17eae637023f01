#include "geo/geolocation.hpp"

#include "core/json_dom.hpp"
#include "net/http_client.hpp"
#include "net/target.hpp"

namespace reconkit::geo {

bool ParseGeolocationResponse(std::string_view json, GeoInfo& info, std::string& error) {
  core::json::Value root;
  std::string parse_error;
  if (!core::json::Parse(json, root, parse_error)) {
    error = "invalid geolocation response: " + parse_error;
    return false;
  }
  if (!root.is_object()) {
    error = "invalid geolocation response: top-level value must be an object";
    return false;
  }

  const std::string status = core::json::GetStringOr(root, "status", "");
  if (status != "success") {
    const std::string message = core::json::GetStringOr(root, "message", "no message");
    error = "geolocation lookup failed: status='" + status + "' message='" + message + "'";
    return false;
  }

  info.ip = core::json::GetStringOr(root, "query", info.ip);
  info.country = core::json::GetStringOr(root, "country", "Unknown");
  info.region = core::json::GetStringOr(root, "regionName", "Unknown");
  info.city = core::json::GetStringOr(root, "city", "Unknown");
  info.isp = core::json::GetStringOr(root, "isp", "Unknown");
  info.org = core::json::GetStringOr(root, "org", "Unknown");
  info.as = core::json::GetStringOr(root, "as", "Unknown");
  return true;
}

bool LookupGeolocation(const std::string& ip, std::chrono::milliseconds timeout,
                       const core::CancellationToken& cancel, GeoInfo& info,
                       std::string& error) {
  if (ip.empty()) {
    error = "geolocation lookup requires an address";
    return false;
  }

  net::HttpRequest request;
  request.url = net::ExpandTemplate(kGeolocationUrlTemplate, ip);
  request.timeout = timeout;
  request.follow_redirects = false;
  request.capture_body = true;
  request.max_body_bytes = 64U * 1024U;

  const net::HttpResult result = net::HttpGet(request, &cancel);
  if (!result.ok()) {
    error = std::string("geolocation request failed (") + net::ToString(result.failure) +
            "): " + result.error;
    return false;
  }
  if (result.response.status_code != 200) {
    error = "geolocation request returned HTTP " + std::to_string(result.response.status_code);
    return false;
  }

  info.ip = ip;
  return ParseGeolocationResponse(result.response.body, info, error);
}

} // namespace reconkit::geo
