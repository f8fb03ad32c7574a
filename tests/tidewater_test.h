#pragma once

// Shared scenario builders for the test executables.
//
// Individual tests use their own local TW_ASSERT macro (or Catch2), so this header
// carries no assertion machinery.

#include <string>

#include "tidewater/core/config.h"

namespace tidewater::test {

inline ShipSpec ship_spec(const std::string& id, double capacity, double speed, double cargo,
                          const std::string& location = "port_main") {
  ShipSpec s;
  s.id = id;
  s.name = "Ship " + id;
  s.capacity = capacity;
  s.speed = speed;
  s.initial_location = location;
  s.initial_cargo = cargo;
  return s;
}

inline CustomerSpec customer_spec(const std::string& id, const std::string& location, double demand_rate,
                                  double inventory, double min_inventory, double max_inventory) {
  CustomerSpec c;
  c.id = id;
  c.name = "Customer " + id;
  c.location = location;
  c.demand_rate = demand_rate;
  c.initial_inventory = inventory;
  c.min_inventory = min_inventory;
  c.max_inventory = max_inventory;
  return c;
}

// Symmetric leg plus both diagonal entries.
inline void connect(DistanceMatrix& m, const std::string& a, const std::string& b, double d) {
  m.set(a, a, 0.0);
  m.set(b, b, 0.0);
  m.set(a, b, d);
  m.set(b, a, d);
}

// One ship (capacity 10000, cargo 8000, speed 10) at port_main, one customer at site_a
// 100 distance units away (10h sailing). demand 100/h, inventory 2400 of max 6000,
// threshold 1 day: the first consumption tick triggers a dispatch.
inline ScenarioConfig single_lane_scenario(double duration = 48.0) {
  ScenarioConfig cfg;
  cfg.ships.push_back(ship_spec("ship_1", 10000.0, 10.0, 8000.0));
  cfg.customers.push_back(customer_spec("customer_1", "site_a", 100.0, 2400.0, 1200.0, 6000.0));
  connect(cfg.distances, "port_main", "site_a", 100.0);
  cfg.params.simulation_duration = duration;
  cfg.params.time_step = 1.0;
  cfg.params.resupply_threshold_days = 1.0;
  return cfg;
}

} // namespace tidewater::test
