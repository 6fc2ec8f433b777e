/**
 * @file time_format.cpp
 * @brief Timestamp formatting implementation
 */

#include "utils/time_format.h"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace graphvault::utils {

namespace {

struct SplitTime {
  std::tm tm_buf{};
  int64_t micros = 0;
};

SplitTime Split(std::chrono::system_clock::time_point time_point) {
  using std::chrono::duration_cast;
  using std::chrono::microseconds;

  constexpr int64_t kMicrosPerSecond = 1000000;

  SplitTime split;
  auto since_epoch = duration_cast<microseconds>(time_point.time_since_epoch()).count();
  int64_t secs = since_epoch / kMicrosPerSecond;
  split.micros = since_epoch % kMicrosPerSecond;
  if (split.micros < 0) {
    split.micros += kMicrosPerSecond;
    --secs;
  }
  auto as_time_t = static_cast<std::time_t>(secs);
  gmtime_r(&as_time_t, &split.tm_buf);  // Thread-safe version of gmtime
  return split;
}

}  // namespace

std::string FormatSnapshotTimestamp(std::chrono::system_clock::time_point time_point) {
  auto split = Split(time_point);
  std::ostringstream oss;
  oss << std::put_time(&split.tm_buf, "%Y%m%d_%H%M%S") << "_" << std::setw(6) << std::setfill('0') << split.micros;
  return oss.str();
}

std::string FormatIso8601(std::chrono::system_clock::time_point time_point) {
  auto split = Split(time_point);
  std::ostringstream oss;
  oss << std::put_time(&split.tm_buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(6) << std::setfill('0')
      << split.micros << "Z";
  return oss.str();
}

}  // namespace graphvault::utils
