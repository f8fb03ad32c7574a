#include "tidewater/core/serialization.h"

#include <type_traits>
#include <utility>
#include <variant>

#include "tidewater/core/errors.h"

namespace tidewater {
namespace {

using json::Array;
using json::Object;
using json::Value;

const Object& require_object(const Value& v, const std::string& where) {
  const Object* o = v.as_object();
  if (!o) throw MalformedConfiguration(where + ": expected an object");
  return *o;
}

const Array& require_array(const Value& v, const std::string& where) {
  const Array* a = v.as_array();
  if (!a) throw MalformedConfiguration(where + ": expected an array");
  return *a;
}

const Value& require_field(const Object& o, const std::string& key, const std::string& where) {
  auto it = o.find(key);
  if (it == o.end()) throw MalformedConfiguration(where + ": missing '" + key + "'");
  return it->second;
}

double require_number(const Object& o, const std::string& key, const std::string& where) {
  const double* d = require_field(o, key, where).as_number();
  if (!d) throw MalformedConfiguration(where + ": '" + key + "' must be a number");
  return *d;
}

std::string require_string(const Object& o, const std::string& key, const std::string& where) {
  const std::string* s = require_field(o, key, where).as_string();
  if (!s) throw MalformedConfiguration(where + ": '" + key + "' must be a string");
  return *s;
}

double optional_number(const Object& o, const std::string& key, double def, const std::string& where) {
  auto it = o.find(key);
  if (it == o.end() || it->second.is_null()) return def;
  const double* d = it->second.as_number();
  if (!d) throw MalformedConfiguration(where + ": '" + key + "' must be a number");
  return *d;
}

std::string entry_name(const char* file, std::size_t index) {
  return std::string(file) + "[" + std::to_string(index) + "]";
}

Value count(std::size_t n) { return static_cast<double>(n); }

Value payload_fields(const EventPayload& payload) {
  return std::visit(
      [](const auto& e) -> Value {
        using T = std::decay_t<decltype(e)>;
        Object o;
        if constexpr (std::is_same_v<T, ConsumptionEvent>) {
          o["customer_id"] = e.customer_id;
          o["demand"] = e.demand;
          o["consumed"] = e.consumed;
          o["current_inventory"] = e.inventory_after;
          o["days_of_supply"] = e.days_of_supply;
        } else if constexpr (std::is_same_v<T, DeliveryStartedEvent>) {
          o["ship_id"] = e.ship_id;
          o["customer_id"] = e.customer_id;
          o["amount"] = e.requested;
          o["ship_cargo"] = e.available_cargo;
        } else if constexpr (std::is_same_v<T, ShipArrivedEvent>) {
          o["ship_id"] = e.ship_id;
          o["location"] = e.location;
          if (!e.customer_id.empty()) o["customer_id"] = e.customer_id;
        } else if constexpr (std::is_same_v<T, DeliveryCompletedEvent>) {
          o["ship_id"] = e.ship_id;
          o["customer_id"] = e.customer_id;
          o["amount_delivered"] = e.received;
          o["amount_received"] = e.received;
          o["amount_unloaded"] = e.unloaded;
          o["customer_inventory"] = e.customer_inventory;
          o["ship_remaining_cargo"] = e.ship_remaining_cargo;
        } else if constexpr (std::is_same_v<T, DeliveryFailedEvent>) {
          o["customer_id"] = e.customer_id;
          o["reason"] = std::string(delivery_failure_reason_name(e.reason));
          o["needed"] = e.needed;
        } else if constexpr (std::is_same_v<T, ResupplyStartedEvent>) {
          o["ship_id"] = e.ship_id;
          o["from_location"] = e.from_location;
          o["to_location"] = e.port;
          o["current_cargo"] = e.cargo;
        } else if constexpr (std::is_same_v<T, ResupplyCompletedEvent>) {
          o["ship_id"] = e.ship_id;
          o["location"] = e.location;
          o["new_cargo"] = e.cargo;
        } else if constexpr (std::is_same_v<T, ProcessFailedEvent>) {
          o["process"] = e.process;
          if (!e.ship_id.empty()) o["ship_id"] = e.ship_id;
          if (!e.customer_id.empty()) o["customer_id"] = e.customer_id;
          o["error"] = e.error;
        }
        return o;
      },
      payload);
}

} // namespace

std::vector<ShipSpec> ships_from_json(const Value& v) {
  const Array& arr = require_array(v, "ships.json");
  std::vector<ShipSpec> out;
  out.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string where = entry_name("ships.json", i);
    const Object& o = require_object(arr[i], where);
    ShipSpec s;
    s.id = require_string(o, "id", where);
    s.name = require_string(o, "name", where);
    s.capacity = require_number(o, "capacity", where);
    s.speed = require_number(o, "speed", where);
    s.initial_location = require_string(o, "initial_location", where);
    s.initial_cargo = optional_number(o, "initial_cargo", 0.0, where);
    out.push_back(std::move(s));
  }
  return out;
}

std::vector<CustomerSpec> customers_from_json(const Value& v) {
  const Array& arr = require_array(v, "customers.json");
  std::vector<CustomerSpec> out;
  out.reserve(arr.size());
  for (std::size_t i = 0; i < arr.size(); ++i) {
    const std::string where = entry_name("customers.json", i);
    const Object& o = require_object(arr[i], where);
    CustomerSpec c;
    c.id = require_string(o, "id", where);
    c.name = require_string(o, "name", where);
    c.location = require_string(o, "location", where);
    c.demand_rate = require_number(o, "demand_rate", where);
    c.initial_inventory = require_number(o, "initial_inventory", where);
    c.min_inventory = require_number(o, "min_inventory", where);
    c.max_inventory = require_number(o, "max_inventory", where);
    out.push_back(std::move(c));
  }
  return out;
}

DistanceMatrix distances_from_json(const Value& v) {
  DistanceMatrix m;
  for (const auto& [from, row] : require_object(v, "distances.json")) {
    const std::string where = "distances.json[" + from + "]";
    for (const auto& [to, d] : require_object(row, where)) {
      const double* dist = d.as_number();
      if (!dist) throw MalformedConfiguration(where + ": '" + to + "' must be a number");
      m.set(from, to, *dist);
    }
  }
  return m;
}

SimParams params_from_json(const Value& v) {
  const Object& o = require_object(v, "simulation_params.json");
  require_field(o, "simulation_duration", "simulation_params.json");
  require_field(o, "time_step", "simulation_params.json");

  SimParams p;
  for (const auto& [k, val] : o) apply_param_override(p, k, val);
  return p;
}

Value ships_to_json(const std::vector<ShipSpec>& ships) {
  Array arr;
  arr.reserve(ships.size());
  for (const auto& s : ships) {
    Object o;
    o["id"] = s.id;
    o["name"] = s.name;
    o["capacity"] = s.capacity;
    o["speed"] = s.speed;
    o["initial_location"] = s.initial_location;
    o["initial_cargo"] = s.initial_cargo;
    arr.push_back(o);
  }
  return arr;
}

Value customers_to_json(const std::vector<CustomerSpec>& customers) {
  Array arr;
  arr.reserve(customers.size());
  for (const auto& c : customers) {
    Object o;
    o["id"] = c.id;
    o["name"] = c.name;
    o["location"] = c.location;
    o["demand_rate"] = c.demand_rate;
    o["initial_inventory"] = c.initial_inventory;
    o["min_inventory"] = c.min_inventory;
    o["max_inventory"] = c.max_inventory;
    arr.push_back(o);
  }
  return arr;
}

Value distances_to_json(const DistanceMatrix& distances) {
  Object root;
  for (const auto& [from, row] : distances.rows()) {
    Object r;
    for (const auto& [to, d] : row) r[to] = d;
    root[from] = r;
  }
  return root;
}

Value params_to_json(const SimParams& p) {
  Object o;
  o["simulation_duration"] = p.simulation_duration;
  o["time_step"] = p.time_step;
  o["resupply_threshold_days"] = p.resupply_threshold_days;
  o["loading_rate"] = p.loading_rate;
  o["unloading_rate"] = p.unloading_rate;
  o["port_resupply_delay"] = p.port_resupply_delay;
  o["random_seed"] = static_cast<double>(p.random_seed);
  o["port_location"] = p.port_location;
  o["delivery_target_fraction"] = p.delivery_target_fraction;
  o["resupply_cargo_fraction"] = p.resupply_cargo_fraction;
  o["ship_speed_multiplier"] = p.ship_speed_multiplier;
  return o;
}

Value event_to_json(const SimEvent& ev) {
  Value v = payload_fields(ev.payload);
  Object& o = *v.as_object();
  o["seq"] = static_cast<double>(ev.seq);
  o["time"] = ev.time;
  o["type"] = std::string(event_type_name(ev.payload));
  return v;
}

Value metrics_to_json(const SimMetrics& m) {
  Object customers;
  for (const auto& [id, c] : m.customer_metrics) {
    Object o;
    o["avg_inventory"] = c.avg_inventory;
    o["min_inventory"] = c.min_inventory;
    o["stockout_events"] = static_cast<double>(c.stockout_events);
    o["stockout_hours"] = c.stockout_hours;
    o["service_level"] = c.service_level;
    o["total_shortage"] = c.total_shortage;
    o["total_received"] = c.total_received;
    customers[id] = o;
  }

  Object ships;
  for (const auto& [id, s] : m.ship_metrics) {
    Object o;
    o["total_distance"] = s.total_distance;
    o["num_deliveries"] = static_cast<double>(s.num_deliveries);
    o["num_resupplies"] = static_cast<double>(s.num_resupplies);
    o["total_delivered"] = s.total_delivered;
    ships[id] = o;
  }

  Object root;
  root["overall_service_level"] = m.overall_service_level;
  root["total_stockout_events"] = static_cast<double>(m.total_stockout_events);
  root["total_failed_dispatches"] = static_cast<double>(m.total_failed_dispatches);
  root["total_process_failures"] = static_cast<double>(m.total_process_failures);
  root["customer_metrics"] = customers;
  root["ship_metrics"] = ships;
  return root;
}

Value results_to_json(const SimResults& r) {
  Object counts;
  counts["ships"] = count(r.ships.size());
  counts["customers"] = count(r.customers.size());
  counts["events"] = count(r.events.size());

  Object meta;
  meta["start_time"] = r.metadata.start_time;
  meta["end_time"] = r.metadata.end_time;
  meta["duration_seconds"] = r.metadata.duration_seconds;
  meta["counts"] = counts;
  meta["params"] = params_to_json(r.params);

  Array events;
  events.reserve(r.events.size());
  for (const auto& ev : r.events) events.push_back(event_to_json(ev));

  Array ships_history;
  for (const auto& [id, ship] : r.ships) {
    for (const auto& j : ship.travel_history) {
      Object o;
      o["ship_id"] = id;
      o["ship_name"] = ship.name;
      o["departure"] = j.departure;
      o["destination"] = j.destination;
      o["departure_time"] = j.departure_time;
      o["arrival_time"] = j.arrival_time;
      o["cargo"] = j.cargo;
      ships_history.push_back(o);
    }
  }

  Array customers_history;
  for (const auto& [id, c] : r.customers) {
    for (const auto& rec : c.inventory_history) {
      Object o;
      o["customer_id"] = id;
      o["customer_name"] = c.name;
      o["time"] = rec.time;
      o["inventory"] = rec.inventory_after;
      o["demand"] = rec.demand;
      o["fulfilled"] = rec.fulfilled;
      o["shortage"] = rec.shortage;
      customers_history.push_back(o);
    }
  }

  Object root;
  root["metadata"] = meta;
  root["events"] = events;
  root["metrics"] = metrics_to_json(r.metrics);
  root["ships_history"] = ships_history;
  root["customers_history"] = customers_history;
  return root;
}

Value study_to_json(const std::vector<StudyRun>& runs) {
  Array arr;
  arr.reserve(runs.size());
  for (const auto& run : runs) {
    Object o;
    o["param_name"] = run.param_name;
    o["param_value"] = run.param_value;
    o["metrics"] = metrics_to_json(run.metrics);
    arr.push_back(o);
  }
  return arr;
}

} // namespace tidewater
