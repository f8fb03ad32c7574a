#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tidewater {

// Directed location -> location distances (non-negative, arbitrary length units).
//
// There is no implicit zero distance from a location to itself; scenarios list the
// diagonal explicitly like any other leg.
class DistanceMatrix {
 public:
  void set(const std::string& from, const std::string& to, double distance);

  std::optional<double> find(const std::string& from, const std::string& to) const;

  // Throws RouteNotFound when the leg is missing.
  double at(const std::string& from, const std::string& to) const;

  bool has_location(const std::string& location) const;

  // All locations appearing as a source or a destination, sorted.
  std::vector<std::string> locations() const;

  const std::map<std::string, std::map<std::string, double>>& rows() const { return rows_; }
  bool empty() const { return rows_.empty(); }

 private:
  std::map<std::string, std::map<std::string, double>> rows_;
};

} // namespace tidewater
