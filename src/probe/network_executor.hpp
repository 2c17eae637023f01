#pragma once

#include "probe/probe_executor.hpp"

#include <string>

namespace reconkit::probe {

// Production executor: libcurl for the HTTP kinds, non-blocking sockets for
// TCP connect. Stateless apart from its User-Agent, so one instance is shared
// by every worker.
class NetworkProbeExecutor final : public IProbeExecutor {
public:
  NetworkProbeExecutor();
  explicit NetworkProbeExecutor(std::string user_agent);

  ProbeOutcome Execute(const ProbeSpec& spec, std::string_view target,
                       std::chrono::milliseconds timeout,
                       const core::CancellationToken& cancel) override;

private:
  ProbeOutcome ExecuteHttpExistence(const HttpExistenceParams& params, std::string_view target,
                                    std::chrono::milliseconds timeout,
                                    const core::CancellationToken& cancel) const;
  ProbeOutcome ExecuteTcpConnect(const TcpConnectParams& params, std::string_view target,
                                 std::chrono::milliseconds timeout,
                                 const core::CancellationToken& cancel) const;
  ProbeOutcome ExecuteHeaderFetch(const HeaderFetchParams& params, std::string_view target,
                                  std::chrono::milliseconds timeout,
                                  const core::CancellationToken& cancel) const;
  ProbeOutcome ExecutePathProbe(const PathProbeParams& params, std::string_view target,
                                std::chrono::milliseconds timeout,
                                const core::CancellationToken& cancel) const;

  std::string user_agent_;
};

} // namespace reconkit::probe
