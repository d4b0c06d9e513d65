#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace walletcore {
namespace common {

// Formats the current wall-clock time in the local zone with a strftime pattern.
inline std::string format_local_now(const char* pattern) {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
#if defined(_WIN32)
  localtime_s(&local, &now);
#else
  localtime_r(&now, &local);
#endif
  char buffer[64];
  const auto written = std::strftime(buffer, sizeof(buffer), pattern, &local);
  return std::string(buffer, written);
}

}  // namespace common
}  // namespace walletcore
