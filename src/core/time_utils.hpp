#ifndef RECONKIT_CORE_TIME_UTILS_HPP_
#define RECONKIT_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace reconkit::core {

// Canonical UTC timestamp formatter used by logs and report exports.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Local wall-clock stamp for console headings ("2024-05-01 13:45:10").
inline std::string FormatLocalTimestamp(std::chrono::system_clock::time_point timestamp) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm local_time{};
#if defined(_WIN32)
  if (localtime_s(&local_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (localtime_r(&epoch_seconds, &local_time) == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

// Seconds with two decimals, the precision used by scan summaries.
inline std::string FormatSeconds(std::chrono::nanoseconds duration) {
  const double seconds = std::chrono::duration<double>(duration).count();
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << seconds;
  return out.str();
}

inline std::int64_t ToMilliseconds(std::chrono::nanoseconds duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

} // namespace reconkit::core

#endif // RECONKIT_CORE_TIME_UTILS_HPP_
