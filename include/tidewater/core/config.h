#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "tidewater/core/distance_matrix.h"
#include "tidewater/util/json.h"

namespace tidewater {

// Run parameters. All times are in simulated hours.
struct SimParams {
  // Horizon. Resumptions scheduled after this time are discarded.
  double simulation_duration{720.0};

  // Consumption tick length. Must be > 0.
  double time_step{1.0};

  // A customer whose days of supply drop below this asks the dispatcher for a delivery.
  double resupply_threshold_days{3.0};

  // Cargo transfer rates (units per hour).
  double loading_rate{5000.0};
  double unloading_rate{4000.0};

  // Fixed turnaround at the port before loading starts.
  double port_resupply_delay{12.0};

  std::uint64_t random_seed{42};

  // Where ships reload.
  std::string port_location{"port_main"};

  // Deliveries aim to fill a customer up to this fraction of max_inventory.
  double delivery_target_fraction{0.8};

  // After a delivery, a ship holding less than this fraction of its capacity
  // goes back to the port instead of becoming available.
  double resupply_cargo_fraction{0.2};

  // Scales every ship's configured speed at setup (used by parameter studies).
  double ship_speed_multiplier{1.0};
};

struct ShipSpec {
  std::string id;
  std::string name;
  double capacity{0.0};
  double speed{0.0};
  std::string initial_location;
  double initial_cargo{0.0};
};

struct CustomerSpec {
  std::string id;
  std::string name;
  std::string location;
  double demand_rate{0.0}; // units per hour
  double initial_inventory{0.0};
  double min_inventory{0.0};
  double max_inventory{0.0};
};

// Read-only configuration snapshot consumed by Simulation setup.
struct ScenarioConfig {
  std::vector<ShipSpec> ships;
  std::vector<CustomerSpec> customers;
  DistanceMatrix distances;
  SimParams params;
};

// Parameter name -> value, applied on top of the loaded parameters before setup.
using ParamOverrides = std::map<std::string, json::Value>;

// Apply one named override. Unknown names are logged and ignored.
//
// Throws MalformedConfiguration if the value has the wrong JSON type for the parameter.
void apply_param_override(SimParams& params, const std::string& name, const json::Value& value);

void apply_param_overrides(SimParams& params, const ParamOverrides& overrides);

// Names accepted by apply_param_override().
const std::vector<std::string>& known_param_names();

// Returns a list of human-readable problems. An empty list means "valid".
std::vector<std::string> validate_scenario(const ScenarioConfig& cfg);

} // namespace tidewater
