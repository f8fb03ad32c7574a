#include "tidewater/core/distance_matrix.h"

#include <algorithm>

#include "tidewater/core/errors.h"

namespace tidewater {

void DistanceMatrix::set(const std::string& from, const std::string& to, double distance) {
  rows_[from][to] = distance;
}

std::optional<double> DistanceMatrix::find(const std::string& from, const std::string& to) const {
  const auto row = rows_.find(from);
  if (row == rows_.end()) return std::nullopt;
  const auto cell = row->second.find(to);
  if (cell == row->second.end()) return std::nullopt;
  return cell->second;
}

double DistanceMatrix::at(const std::string& from, const std::string& to) const {
  if (const auto d = find(from, to)) return *d;
  throw RouteNotFound(from, to);
}

bool DistanceMatrix::has_location(const std::string& location) const {
  if (rows_.count(location)) return true;
  for (const auto& [_, row] : rows_) {
    if (row.count(location)) return true;
  }
  return false;
}

std::vector<std::string> DistanceMatrix::locations() const {
  std::vector<std::string> out;
  for (const auto& [from, row] : rows_) {
    out.push_back(from);
    for (const auto& [to, _] : row) out.push_back(to);
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

} // namespace tidewater
