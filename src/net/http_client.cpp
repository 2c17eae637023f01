#include "net/http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <memory>
#include <string>
#include <string_view>

namespace reconkit::net {

namespace {

// Owns the process-wide curl state for the lifetime of the program.
class CurlGlobalScope {
public:
  CurlGlobalScope() : rc_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
  ~CurlGlobalScope() {
    if (rc_ == CURLE_OK) {
      curl_global_cleanup();
    }
  }

  CurlGlobalScope(const CurlGlobalScope&) = delete;
  CurlGlobalScope& operator=(const CurlGlobalScope&) = delete;

  bool ok() const {
    return rc_ == CURLE_OK;
  }

private:
  CURLcode rc_;
};

const CurlGlobalScope& GlobalScope() {
  static const CurlGlobalScope scope;
  return scope;
}

struct EasyHandleDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

struct TransferState {
  HttpResponse* response = nullptr;
  bool capture_body = true;
  std::size_t max_body_bytes = 0;
  const core::CancellationToken* cancel = nullptr;
};

std::string_view TrimView(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::size_t OnBody(char* data, std::size_t size, std::size_t count, void* user) {
  auto* state = static_cast<TransferState*>(user);
  const std::size_t bytes = size * count;
  state->response->body_bytes += bytes;
  if (state->capture_body && state->response->body.size() < state->max_body_bytes) {
    const std::size_t room = state->max_body_bytes - state->response->body.size();
    state->response->body.append(data, std::min(bytes, room));
  }
  return bytes;
}

std::size_t OnHeader(char* data, std::size_t size, std::size_t count, void* user) {
  auto* state = static_cast<TransferState*>(user);
  const std::size_t bytes = size * count;
  const std::string_view line = TrimView(std::string_view(data, bytes));

  if (line.rfind("HTTP/", 0) == 0U) {
    // New status line: a redirect hop or an interim 1xx response ended.
    state->response->headers.clear();
    return bytes;
  }

  const std::size_t colon = line.find(':');
  if (colon == std::string_view::npos || colon == 0U) {
    return bytes;
  }
  state->response->headers.emplace_back(std::string(TrimView(line.substr(0, colon))),
                                        std::string(TrimView(line.substr(colon + 1U))));
  return bytes;
}

int OnProgress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* state = static_cast<const TransferState*>(user);
  if (state->cancel != nullptr && state->cancel->IsCancelled()) {
    return 1;
  }
  return 0;
}

TransportFailure ClassifyCurlCode(CURLcode code, long os_errno) {
  switch (code) {
  case CURLE_OK:
    return TransportFailure::kNone;
  case CURLE_URL_MALFORMAT:
  case CURLE_UNSUPPORTED_PROTOCOL:
    return TransportFailure::kMalformedUrl;
  case CURLE_COULDNT_RESOLVE_HOST:
  case CURLE_COULDNT_RESOLVE_PROXY:
    return TransportFailure::kDnsResolution;
  case CURLE_COULDNT_CONNECT:
    return os_errno == ECONNREFUSED ? TransportFailure::kConnectionRefused
                                    : TransportFailure::kTransport;
  case CURLE_OPERATION_TIMEDOUT:
    return TransportFailure::kTimeout;
  case CURLE_ABORTED_BY_CALLBACK:
    return TransportFailure::kCancelled;
  default:
    return TransportFailure::kTransport;
  }
}

} // namespace

const char* ToString(TransportFailure failure) {
  switch (failure) {
  case TransportFailure::kNone:
    return "none";
  case TransportFailure::kMalformedUrl:
    return "malformed_target";
  case TransportFailure::kDnsResolution:
    return "dns_resolution_failure";
  case TransportFailure::kConnectionRefused:
    return "connection_refused";
  case TransportFailure::kTimeout:
    return "connection_timeout";
  case TransportFailure::kTransport:
    return "transport_error";
  case TransportFailure::kCancelled:
    return "cancelled";
  }
  return "transport_error";
}

std::optional<std::string> FindHeader(const HttpHeaders& headers, std::string_view name) {
  for (const auto& [key, value] : headers) {
    if (key.size() != name.size()) {
      continue;
    }
    const bool equal = std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) ==
             std::tolower(static_cast<unsigned char>(b));
    });
    if (equal) {
      return value;
    }
  }
  return std::nullopt;
}

void EnsureHttpTransportInitialized() {
  (void)GlobalScope();
}

HttpResult HttpGet(const HttpRequest& request, const core::CancellationToken* cancel) {
  HttpResult result;

  if (!GlobalScope().ok()) {
    result.failure = TransportFailure::kTransport;
    result.error = "libcurl global initialization failed";
    return result;
  }
  if (request.timeout <= std::chrono::milliseconds::zero()) {
    result.failure = TransportFailure::kTimeout;
    result.error = "no time budget left for request";
    return result;
  }

  EasyHandle easy(curl_easy_init());
  if (easy == nullptr) {
    result.failure = TransportFailure::kTransport;
    result.error = "curl_easy_init failed";
    return result;
  }

  TransferState state;
  state.response = &result.response;
  state.capture_body = request.capture_body;
  state.max_body_bytes = request.max_body_bytes;
  state.cancel = cancel;

  char error_buffer[CURL_ERROR_SIZE] = {0};
  const long timeout_ms = static_cast<long>(request.timeout.count());

  CURL* handle = easy.get();
  curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle, CURLOPT_USERAGENT, request.user_agent.c_str());
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
  curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, OnBody);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
  curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, OnHeader);
  curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
  curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, OnProgress);
  curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &state);

  const CURLcode code = curl_easy_perform(handle);

  long os_errno = 0;
  curl_easy_getinfo(handle, CURLINFO_OS_ERRNO, &os_errno);
  result.failure = ClassifyCurlCode(code, os_errno);

  if (result.failure != TransportFailure::kNone) {
    result.error = error_buffer[0] != '\0' ? std::string(error_buffer)
                                           : std::string(curl_easy_strerror(code));
    return result;
  }

  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &result.response.status_code);
  char* effective_url = nullptr;
  if (curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK &&
      effective_url != nullptr) {
    result.response.effective_url = effective_url;
  }
  return result;
}

} // namespace reconkit::net
