#pragma once

#include <stdexcept>
#include <string>

namespace tidewater {

// Raised while loading or validating a scenario, before the clock starts.
class MalformedConfiguration : public std::runtime_error {
 public:
  explicit MalformedConfiguration(const std::string& what) : std::runtime_error(what) {}
};

// A failure that is fatal to a single simulation process only.
//
// The scheduler drops the process that raised it and keeps running everything else.
class ProcessError : public std::runtime_error {
 public:
  explicit ProcessError(const std::string& what) : std::runtime_error(what) {}
};

class RouteNotFound : public ProcessError {
 public:
  RouteNotFound(const std::string& from, const std::string& to)
      : ProcessError("No route found from " + from + " to " + to), from_(from), to_(to) {}

  const std::string& from() const { return from_; }
  const std::string& to() const { return to_; }

 private:
  std::string from_;
  std::string to_;
};

} // namespace tidewater
