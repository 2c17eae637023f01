#pragma once

namespace reconkit::core::errors {

// Stable process-exit contract for the reconkit subcommands.
//
// 0/1/2 keep their conventional meanings (success, failed command, usage).
// A rejected target is reported separately from usage errors because it is
// detected after argument parsing, before any probe is dispatched. Interrupt
// follows the shell convention of 128 + SIGINT.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInvalidTarget = 10,
  kInterrupted = 130,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace reconkit::core::errors
