#include "tidewater/core/scenario.h"

#include <string>
#include <vector>

#include "tidewater/util/hash_rng.h"

namespace tidewater {
namespace {

ShipSpec ship(const char* id, const char* name, double capacity, double speed, double cargo) {
  ShipSpec s;
  s.id = id;
  s.name = name;
  s.capacity = capacity;
  s.speed = speed;
  s.initial_location = "port_main";
  s.initial_cargo = cargo;
  return s;
}

// Inventories are expressed in hours of demand: start at 48h, floor at 24h, cap at 120h.
CustomerSpec customer(const char* id, const char* name, const char* location, double demand_rate) {
  CustomerSpec c;
  c.id = id;
  c.name = name;
  c.location = location;
  c.demand_rate = demand_rate;
  c.initial_inventory = demand_rate * 48.0;
  c.min_inventory = demand_rate * 24.0;
  c.max_inventory = demand_rate * 120.0;
  return c;
}

} // namespace

ScenarioConfig make_example_scenario(std::uint64_t seed) {
  ScenarioConfig cfg;
  cfg.params.random_seed = seed;

  cfg.ships.push_back(ship("ship_1", "Vessel Alpha", 100000.0, 25.0, 80000.0));
  cfg.ships.push_back(ship("ship_2", "Vessel Beta", 75000.0, 30.0, 60000.0));
  cfg.ships.push_back(ship("ship_3", "Vessel Gamma", 120000.0, 20.0, 100000.0));

  cfg.customers.push_back(customer("customer_1", "Manufacturing Plant A", "location_a", 1000.0));
  cfg.customers.push_back(customer("customer_2", "Distribution Center B", "location_b", 750.0));
  cfg.customers.push_back(customer("customer_3", "Processing Facility C", "location_c", 1200.0));

  const std::vector<std::string> locations = {cfg.params.port_location, "location_a", "location_b", "location_c"};
  util::HashRng rng(seed);
  for (std::size_t i = 0; i < locations.size(); ++i) {
    cfg.distances.set(locations[i], locations[i], 0.0);
    for (std::size_t j = i + 1; j < locations.size(); ++j) {
      const double d = rng.range(200.0, 800.0);
      cfg.distances.set(locations[i], locations[j], d);
      cfg.distances.set(locations[j], locations[i], d);
    }
  }
  return cfg;
}

} // namespace tidewater
