#pragma once

#include "probe/probe_spec.hpp"

#include <cstddef>
#include <string>

namespace reconkit::probe {

enum class VerdictState {
  kPresent,
  kAbsent,
  kIndeterminate,
};

inline const char* ToString(VerdictState state) {
  switch (state) {
  case VerdictState::kPresent:
    return "present";
  case VerdictState::kAbsent:
    return "absent";
  case VerdictState::kIndeterminate:
    return "indeterminate";
  }
  return "indeterminate";
}

// Classified result of one probe. Computed once from its outcome.
struct Verdict {
  std::size_t spec_index = 0;
  std::string spec_id;
  ProbeKind kind = ProbeKind::kTcpConnect;
  VerdictState state = VerdictState::kIndeterminate;
  std::string reason;
};

} // namespace reconkit::probe
