#pragma once

#include <chrono>
#include <string>

namespace tidewater {

// Wall-clock helpers for run metadata. Simulated time never goes through these.

// "YYYY-MM-DDTHH:MM:SSZ" (UTC).
std::string format_iso8601_utc(std::chrono::system_clock::time_point t);

// "YYYYMMDD_HHMMSS" (UTC), suitable for file names.
std::string format_file_stamp_utc(std::chrono::system_clock::time_point t);

// Format a duration expressed in hours: "36.0h", or "2.5d" once it reaches two days.
std::string format_duration_hours(double hours);

} // namespace tidewater
