#include "net/target.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <string_view>

namespace reconkit::net {

namespace {

struct UrlHandleDeleter {
  void operator()(CURLU* handle) const {
    curl_url_cleanup(handle);
  }
};

using UrlHandle = std::unique_ptr<CURLU, UrlHandleDeleter>;

struct CurlStringDeleter {
  void operator()(char* text) const {
    curl_free(text);
  }
};

using CurlString = std::unique_ptr<char, CurlStringDeleter>;

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::string ToLower(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

bool HasScheme(std::string_view text) {
  return text.find("://") != std::string_view::npos;
}

bool SetUrl(CURLU* handle, std::string_view url, std::string& error) {
  const std::string owned(url);
  const CURLUcode rc = curl_url_set(handle, CURLUPART_URL, owned.c_str(), 0);
  if (rc != CURLUE_OK) {
    error = "unparseable URL '" + owned + "' (curl url code " +
            std::to_string(static_cast<int>(rc)) + ")";
    return false;
  }
  return true;
}

bool GetPart(CURLU* handle, CURLUPart part, std::string& out, std::string& error) {
  char* raw = nullptr;
  const CURLUcode rc = curl_url_get(handle, part, &raw, 0);
  CurlString owned(raw);
  if (rc != CURLUE_OK || owned == nullptr) {
    error = "URL component missing (curl url code " + std::to_string(static_cast<int>(rc)) + ")";
    return false;
  }
  out = owned.get();
  return true;
}

bool ParseHttpUrl(std::string_view url, UrlHandle& handle, std::string& error) {
  handle.reset(curl_url());
  if (handle == nullptr) {
    error = "failed to allocate URL handle";
    return false;
  }
  if (!SetUrl(handle.get(), url, error)) {
    return false;
  }

  std::string scheme;
  if (!GetPart(handle.get(), CURLUPART_SCHEME, scheme, error)) {
    error = "URL has no scheme: " + std::string(url);
    return false;
  }
  scheme = ToLower(scheme);
  if (scheme != "http" && scheme != "https") {
    error = "unsupported URL scheme '" + scheme + "' in " + std::string(url);
    return false;
  }

  std::string host;
  if (!GetPart(handle.get(), CURLUPART_HOST, host, error) || host.empty()) {
    error = "URL has no host: " + std::string(url);
    return false;
  }
  return true;
}

} // namespace

std::string ExpandTemplate(std::string_view url_template, std::string_view value) {
  static constexpr std::string_view kPlaceholder = "{}";
  std::string expanded;
  expanded.reserve(url_template.size() + value.size());

  std::size_t pos = 0;
  while (pos < url_template.size()) {
    const std::size_t hit = url_template.find(kPlaceholder, pos);
    if (hit == std::string_view::npos) {
      expanded.append(url_template.substr(pos));
      break;
    }
    expanded.append(url_template.substr(pos, hit - pos));
    expanded.append(value);
    pos = hit + kPlaceholder.size();
  }
  return expanded;
}

bool ValidateHttpUrl(std::string_view url, std::string& error) {
  UrlHandle handle;
  return ParseHttpUrl(url, handle, error);
}

bool NormalizeHttpUrl(std::string_view raw, std::string& url, bool& added_scheme,
                      std::string& error) {
  const std::string_view trimmed = Trim(raw);
  added_scheme = false;
  if (trimmed.empty()) {
    error = "target cannot be empty";
    return false;
  }

  if (HasScheme(trimmed)) {
    url = std::string(trimmed);
  } else {
    url = "http://" + std::string(trimmed);
    added_scheme = true;
  }
  return ValidateHttpUrl(url, error);
}

bool ExtractHost(std::string_view url, std::string& host, std::string& error) {
  UrlHandle handle;
  if (!ParseHttpUrl(url, handle, error)) {
    return false;
  }
  if (!GetPart(handle.get(), CURLUPART_HOST, host, error)) {
    return false;
  }
  if (host.size() >= 2U && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2U);
  }
  return true;
}

bool ResolveUrlReference(std::string_view base, std::string_view reference,
                         std::string& resolved, std::string& error) {
  UrlHandle handle;
  if (!ParseHttpUrl(base, handle, error)) {
    return false;
  }
  // With a base already set, curl resolves a relative reference against it.
  if (!SetUrl(handle.get(), reference, error)) {
    return false;
  }
  return GetPart(handle.get(), CURLUPART_URL, resolved, error);
}

bool ValidateUsername(std::string_view username, std::string& error) {
  const std::string_view trimmed = Trim(username);
  if (trimmed.empty()) {
    error = "username cannot be empty";
    return false;
  }
  if (trimmed.size() != username.size()) {
    error = "username must not carry leading or trailing whitespace";
    return false;
  }

  for (const char c : username) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc) != 0 || std::iscntrl(uc) != 0) {
      error = "username must not contain whitespace or control characters";
      return false;
    }
    if (c == '/' || c == '?' || c == '#' || c == '@' || c == '%' || c == '\\') {
      error = std::string("username must not contain '") + c + "'";
      return false;
    }
  }
  return true;
}

bool NormalizeHostTarget(std::string_view raw, std::string& host, std::string& error) {
  const std::string_view trimmed = Trim(raw);
  if (trimmed.empty()) {
    error = "hostname cannot be empty";
    return false;
  }

  if (HasScheme(trimmed)) {
    return ExtractHost(trimmed, host, error);
  }

  for (const char c : trimmed) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc) != 0 || c == '/' || c == '?' || c == '#' || c == '@') {
      error = "invalid hostname '" + std::string(trimmed) + "'";
      return false;
    }
  }
  host = std::string(trimmed);
  return true;
}

} // namespace reconkit::net
