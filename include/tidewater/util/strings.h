#pragma once

#include <string>
#include <vector>

namespace tidewater {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Splits on `sep`, trimming each token. Empty tokens are dropped.
std::vector<std::string> split_trimmed(const std::string& s, char sep);

// Escapes a string for safe inclusion in a CSV cell.
//
// If the string contains a comma, quote, or newline, the result will be wrapped
// in double-quotes and any internal quotes will be doubled.
std::string csv_escape(const std::string& s);

// Compact decimal formatting for log lines and CSV cells ("%.6g").
std::string format_number(double v);

} // namespace tidewater
