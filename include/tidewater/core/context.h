#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "tidewater/core/config.h"
#include "tidewater/core/entities.h"
#include "tidewater/core/events.h"
#include "tidewater/core/scheduler.h"

namespace tidewater {

// Mutable world of one run. Keyed by id; std::map keeps iteration deterministic.
struct SimState {
  std::map<std::string, Ship> ships;
  std::map<std::string, CustomerSite> customers;
  EventLog events;
};

// Everything a process step may read or mutate, handed to each step explicitly.
struct SimContext {
  const SimParams& params;
  const DistanceMatrix& distances;
  SimState& state;
  Scheduler& scheduler;

  double now() const { return scheduler.now(); }

  void emit(EventPayload payload) { state.events.push(now(), std::move(payload)); }

  void start(std::unique_ptr<Process> p) { scheduler.start(std::move(p)); }

  // Throw ProcessError for ids that are not part of this run.
  Ship& ship(const std::string& id);
  CustomerSite& customer(const std::string& id);
};

// Small helper for safe lookups.
template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

} // namespace tidewater
