#include "tidewater/util/time.h"

#include <cstdio>
#include <ctime>
#include <mutex>

namespace tidewater {
namespace {

// std::gmtime returns a pointer to shared static storage.
std::mutex g_gmtime_mu;

std::tm to_utc_tm(std::chrono::system_clock::time_point t) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(t);
  std::lock_guard<std::mutex> lock(g_gmtime_mu);
  const std::tm* p = std::gmtime(&tt);
  return p ? *p : std::tm{};
}

std::string format_tm(std::chrono::system_clock::time_point t, const char* fmt) {
  const std::tm tm = to_utc_tm(t);
  char buf[64];
  const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

} // namespace

std::string format_iso8601_utc(std::chrono::system_clock::time_point t) {
  return format_tm(t, "%Y-%m-%dT%H:%M:%SZ");
}

std::string format_file_stamp_utc(std::chrono::system_clock::time_point t) {
  return format_tm(t, "%Y%m%d_%H%M%S");
}

std::string format_duration_hours(double hours) {
  if (hours < 0.0) hours = 0.0;
  char buf[32];
  if (hours >= 48.0) {
    std::snprintf(buf, sizeof(buf), "%.1fd", hours / 24.0);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1fh", hours);
  }
  return std::string(buf);
}

} // namespace tidewater
