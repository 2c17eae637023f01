#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace reconkit::cli {

// Flags shared by the probing subcommands. Unset optionals keep each tool's
// own defaults.
struct CommonOptions {
  std::string target;
  // Set once a positional target was seen, even an empty one, so that an
  // empty target is rejected as a target rather than as missing.
  bool target_given = false;
  std::optional<std::size_t> workers;
  std::optional<std::chrono::milliseconds> timeout;
  std::string json_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `reconkit` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0   => success
//   1   => command failed after valid invocation
//   2   => usage error (unknown command / invalid args)
//   10  => target rejected before any probe was dispatched
//   130 => interrupted; partial results were printed
int Dispatch(int argc, char** argv);

} // namespace reconkit::cli
