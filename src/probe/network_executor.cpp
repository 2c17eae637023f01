#include "probe/network_executor.hpp"

#include "net/http_client.hpp"
#include "net/tcp_connect.hpp"
#include "net/target.hpp"

#include <chrono>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace reconkit::probe {

namespace {

using Clock = std::chrono::steady_clock;

ProbeOutcome FromHttpResult(net::HttpResult result, std::string endpoint, bool kept_body) {
  if (!result.ok()) {
    return MakeFailureOutcome(result.failure, std::move(endpoint), std::move(result.error));
  }

  ProbeOutcome outcome;
  outcome.outcome = kept_body ? OutcomeKind::kSuccessWithBody : OutcomeKind::kSuccessWithStatusOnly;
  outcome.failure = FailureCategory::kNone;
  outcome.endpoint = result.response.effective_url.empty() ? std::move(endpoint)
                                                           : result.response.effective_url;
  outcome.status_code = result.response.status_code;
  outcome.headers = std::move(result.response.headers);
  outcome.body = std::move(result.response.body);
  outcome.body_bytes = result.response.body_bytes;
  return outcome;
}

std::chrono::milliseconds RemainingBudget(Clock::time_point deadline) {
  const auto now = Clock::now();
  if (now >= deadline) {
    return std::chrono::milliseconds::zero();
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

} // namespace

NetworkProbeExecutor::NetworkProbeExecutor()
    : NetworkProbeExecutor(std::string(net::kDefaultUserAgent)) {}

NetworkProbeExecutor::NetworkProbeExecutor(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
  net::EnsureHttpTransportInitialized();
}

ProbeOutcome NetworkProbeExecutor::Execute(const ProbeSpec& spec, std::string_view target,
                                           std::chrono::milliseconds timeout,
                                           const core::CancellationToken& cancel) {
  return std::visit(
      [&](const auto& params) -> ProbeOutcome {
        using Params = std::decay_t<decltype(params)>;
        if constexpr (std::is_same_v<Params, HttpExistenceParams>) {
          return ExecuteHttpExistence(params, target, timeout, cancel);
        } else if constexpr (std::is_same_v<Params, TcpConnectParams>) {
          return ExecuteTcpConnect(params, target, timeout, cancel);
        } else if constexpr (std::is_same_v<Params, HeaderFetchParams>) {
          return ExecuteHeaderFetch(params, target, timeout, cancel);
        } else {
          return ExecutePathProbe(params, target, timeout, cancel);
        }
      },
      spec.params);
}

ProbeOutcome NetworkProbeExecutor::ExecuteHttpExistence(
    const HttpExistenceParams& params, std::string_view target, std::chrono::milliseconds timeout,
    const core::CancellationToken& cancel) const {
  std::string url = net::ExpandTemplate(params.url_template, target);
  std::string error;
  if (!net::ValidateHttpUrl(url, error)) {
    return MakeMalformedTargetOutcome(std::move(url), std::move(error));
  }

  net::HttpRequest request;
  request.url = url;
  request.timeout = timeout;
  request.follow_redirects = true;
  request.capture_body = true;
  request.user_agent = user_agent_;
  return FromHttpResult(net::HttpGet(request, &cancel), std::move(url), true);
}

ProbeOutcome NetworkProbeExecutor::ExecuteTcpConnect(const TcpConnectParams& params,
                                                     std::string_view target,
                                                     std::chrono::milliseconds timeout,
                                                     const core::CancellationToken& cancel) const {
  std::string host;
  std::string error;
  const std::string endpoint = std::string(target) + ":" + std::to_string(params.port);
  if (!net::NormalizeHostTarget(target, host, error)) {
    return MakeMalformedTargetOutcome(endpoint, std::move(error));
  }

  net::TcpConnectRequest request;
  request.host = host;
  request.port = params.port;
  request.timeout = timeout;
  request.capture_banner = params.capture_banner;

  net::TcpConnectResult result = net::TcpConnect(request, &cancel);
  if (!result.connected()) {
    ProbeOutcome outcome = MakeFailureOutcome(result.failure, endpoint, std::move(result.error));
    outcome.peer_address = std::move(result.peer_address);
    return outcome;
  }

  ProbeOutcome outcome;
  outcome.outcome = OutcomeKind::kConnectSuccess;
  outcome.failure = FailureCategory::kNone;
  outcome.endpoint = endpoint;
  outcome.peer_address = std::move(result.peer_address);
  outcome.banner = std::move(result.banner);
  return outcome;
}

ProbeOutcome NetworkProbeExecutor::ExecuteHeaderFetch(const HeaderFetchParams& params,
                                                      std::string_view target,
                                                      std::chrono::milliseconds timeout,
                                                      const core::CancellationToken& cancel) const {
  const auto deadline = Clock::now() + timeout;

  auto attempt = [&](const std::string& url_template,
                     std::chrono::milliseconds budget) -> ProbeOutcome {
    std::string url = net::ExpandTemplate(url_template, target);
    std::string error;
    if (!net::ValidateHttpUrl(url, error)) {
      return MakeMalformedTargetOutcome(std::move(url), std::move(error));
    }
    net::HttpRequest request;
    request.url = url;
    request.timeout = budget;
    request.follow_redirects = params.follow_redirects;
    request.capture_body = false;
    request.user_agent = user_agent_;
    return FromHttpResult(net::HttpGet(request, &cancel), std::move(url), false);
  };

  ProbeOutcome first = attempt(params.url_template, timeout);
  if (first.failure == FailureCategory::kNone || first.failure == FailureCategory::kCancelled ||
      !params.fallback_url_template.has_value()) {
    return first;
  }

  const auto remaining = RemainingBudget(deadline);
  if (remaining <= std::chrono::milliseconds::zero()) {
    return first;
  }
  ProbeOutcome second = attempt(*params.fallback_url_template, remaining);
  if (second.failure != FailureCategory::kNone && second.failure != FailureCategory::kCancelled) {
    second.error = "primary: " + first.error + "; fallback: " + second.error;
  }
  return second;
}

ProbeOutcome NetworkProbeExecutor::ExecutePathProbe(const PathProbeParams& params,
                                                    std::string_view target,
                                                    std::chrono::milliseconds timeout,
                                                    const core::CancellationToken& cancel) const {
  std::string url;
  std::string error;
  if (!net::ResolveUrlReference(target, params.path, url, error)) {
    return MakeMalformedTargetOutcome(std::string(target) + " + " + params.path, std::move(error));
  }

  net::HttpRequest request;
  request.url = url;
  request.timeout = timeout;
  request.follow_redirects = false;
  request.capture_body = false;
  request.user_agent = user_agent_;
  return FromHttpResult(net::HttpGet(request, &cancel), std::move(url), false);
}

} // namespace reconkit::probe
