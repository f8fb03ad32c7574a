#include "tidewater/core/config.h"

#include <cmath>
#include <functional>
#include <set>
#include <sstream>
#include <utility>

#include "tidewater/core/errors.h"
#include "tidewater/util/log.h"

namespace tidewater {
namespace {

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

double require_number(const std::string& name, const json::Value& v) {
  const double* d = v.as_number();
  if (!d) throw MalformedConfiguration("Parameter '" + name + "' must be a number");
  return *d;
}

std::string require_string(const std::string& name, const json::Value& v) {
  const std::string* s = v.as_string();
  if (!s) throw MalformedConfiguration("Parameter '" + name + "' must be a string");
  return *s;
}

using Setter = std::function<void(SimParams&, const std::string&, const json::Value&)>;

Setter number_setter(double SimParams::*field) {
  return [field](SimParams& p, const std::string& name, const json::Value& v) {
    p.*field = require_number(name, v);
  };
}

const std::map<std::string, Setter>& setters() {
  static const std::map<std::string, Setter> table = {
      {"simulation_duration", number_setter(&SimParams::simulation_duration)},
      {"time_step", number_setter(&SimParams::time_step)},
      {"resupply_threshold_days", number_setter(&SimParams::resupply_threshold_days)},
      {"loading_rate", number_setter(&SimParams::loading_rate)},
      {"unloading_rate", number_setter(&SimParams::unloading_rate)},
      {"port_resupply_delay", number_setter(&SimParams::port_resupply_delay)},
      {"delivery_target_fraction", number_setter(&SimParams::delivery_target_fraction)},
      {"resupply_cargo_fraction", number_setter(&SimParams::resupply_cargo_fraction)},
      {"ship_speed_multiplier", number_setter(&SimParams::ship_speed_multiplier)},
      {"random_seed",
       [](SimParams& p, const std::string& name, const json::Value& v) {
         const double d = require_number(name, v);
         // 2^64 and above do not fit the seed.
         if (d < 0.0 || d != std::floor(d) || d >= 18446744073709551616.0) {
           throw MalformedConfiguration("Parameter 'random_seed' must be a non-negative 64-bit integer");
         }
         p.random_seed = static_cast<std::uint64_t>(d);
       }},
      {"port_location",
       [](SimParams& p, const std::string& name, const json::Value& v) {
         p.port_location = require_string(name, v);
       }},
  };
  return table;
}

bool positive(double v) { return std::isfinite(v) && v > 0.0; }
bool non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

} // namespace

void apply_param_override(SimParams& params, const std::string& name, const json::Value& value) {
  const auto& table = setters();
  const auto it = table.find(name);
  if (it == table.end()) {
    log::warn("Ignoring unknown simulation parameter: " + name);
    return;
  }
  it->second(params, name, value);
}

void apply_param_overrides(SimParams& params, const ParamOverrides& overrides) {
  for (const auto& [name, value] : overrides) apply_param_override(params, name, value);
}

const std::vector<std::string>& known_param_names() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& [name, _] : setters()) out.push_back(name);
    return out;
  }();
  return names;
}

std::vector<std::string> validate_scenario(const ScenarioConfig& cfg) {
  std::vector<std::string> errors;
  const SimParams& p = cfg.params;

  if (!std::isfinite(p.simulation_duration)) errors.push_back("simulation_duration must be finite");
  if (!positive(p.time_step)) errors.push_back(join("time_step must be > 0 (got ", p.time_step, ")"));
  if (!std::isfinite(p.resupply_threshold_days)) errors.push_back("resupply_threshold_days must be finite");
  if (!positive(p.loading_rate)) errors.push_back(join("loading_rate must be > 0 (got ", p.loading_rate, ")"));
  if (!positive(p.unloading_rate)) {
    errors.push_back(join("unloading_rate must be > 0 (got ", p.unloading_rate, ")"));
  }
  if (!non_negative(p.port_resupply_delay)) errors.push_back("port_resupply_delay must be >= 0");
  if (!positive(p.delivery_target_fraction) || p.delivery_target_fraction > 1.0) {
    errors.push_back("delivery_target_fraction must be in (0, 1]");
  }
  if (!non_negative(p.resupply_cargo_fraction) || p.resupply_cargo_fraction > 1.0) {
    errors.push_back("resupply_cargo_fraction must be in [0, 1]");
  }
  if (!positive(p.ship_speed_multiplier)) errors.push_back("ship_speed_multiplier must be > 0");
  if (p.port_location.empty()) errors.push_back("port_location must not be empty");

  std::set<std::string> ship_ids;
  for (const auto& s : cfg.ships) {
    const std::string who = "Ship '" + s.id + "'";
    if (s.id.empty()) errors.push_back("Ship with empty id");
    if (!ship_ids.insert(s.id).second) errors.push_back(join("Duplicate ship id: ", s.id));
    if (!positive(s.capacity)) errors.push_back(join(who, " capacity must be > 0 (got ", s.capacity, ")"));
    if (!positive(s.speed)) errors.push_back(join(who, " speed must be > 0 (got ", s.speed, ")"));
    if (!non_negative(s.initial_cargo)) errors.push_back(join(who, " initial_cargo must be >= 0"));
    if (s.initial_location.empty()) errors.push_back(join(who, " has an empty initial_location"));
  }

  std::set<std::string> customer_ids;
  for (const auto& c : cfg.customers) {
    const std::string who = "Customer '" + c.id + "'";
    if (c.id.empty()) errors.push_back("Customer with empty id");
    if (!customer_ids.insert(c.id).second) errors.push_back(join("Duplicate customer id: ", c.id));
    if (!std::isfinite(c.demand_rate)) errors.push_back(join(who, " demand_rate must be finite"));
    if (!non_negative(c.max_inventory)) errors.push_back(join(who, " max_inventory must be >= 0"));
    if (!non_negative(c.min_inventory)) errors.push_back(join(who, " min_inventory must be >= 0"));
    if (!non_negative(c.initial_inventory)) errors.push_back(join(who, " initial_inventory must be >= 0"));
    if (c.min_inventory > c.max_inventory) {
      errors.push_back(join(who, " min_inventory (", c.min_inventory, ") exceeds max_inventory (",
                            c.max_inventory, ")"));
    }
    if (c.location.empty()) errors.push_back(join(who, " has an empty location"));
  }

  for (const auto& [from, row] : cfg.distances.rows()) {
    for (const auto& [to, d] : row) {
      if (!non_negative(d)) errors.push_back(join("Distance ", from, " -> ", to, " must be >= 0 (got ", d, ")"));
    }
  }

  return errors;
}

} // namespace tidewater
