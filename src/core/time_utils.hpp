#ifndef RELPACK_CORE_TIME_UTILS_HPP_
#define RELPACK_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <unistd.h>

namespace relpack::core {

// Canonical UTC timestamp used by log lines, events and release records.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// `release-<epoch_ms>-<pid>`. The pid keeps runs started in the same
// millisecond on one host from sharing staging tags.
inline std::string MakeReleaseRunId(std::chrono::system_clock::time_point now,
                                    long pid = static_cast<long>(::getpid())) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "release-" + std::to_string(millis) + "-" + std::to_string(pid);
}

} // namespace relpack::core

#endif // RELPACK_CORE_TIME_UTILS_HPP_
