#pragma once

#include "probe/probe_outcome.hpp"
#include "probe/probe_spec.hpp"
#include "probe/verdict.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reconkit::probe {

// Status codes that reveal a hidden path: served, redirected or forbidden.
bool IsPathProbeHit(long status_code);

// Returns the first marker found in `body`, compared case-insensitively.
// Marker order does not change whether a match exists, only which one is
// reported.
std::optional<std::string> FindAbsenceMarker(std::string_view body,
                                             const std::vector<std::string>& markers);

// Maps a raw outcome to a verdict according to the probe kind:
//
// - http_existence: present on 200 without marker; absent on marker or any
//   other status; indeterminate on timeout or network error
// - tcp_connect: present on connect; absent on refusal, timeout or
//   unreachable; indeterminate when the host does not resolve
// - http_header_fetch: present on any response; indeterminate otherwise
// - path_probe: present on 200/301/302/403; absent otherwise
//
// A malformed target is indeterminate for every kind.
Verdict Classify(const ProbeSpec& spec, const ProbeOutcome& outcome);

} // namespace reconkit::probe
