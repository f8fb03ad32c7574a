#include "tidewater/core/entities.h"

#include <algorithm>
#include <limits>
#include <utility>

namespace tidewater {

double Ship::load(double amount) {
  if (amount <= 0.0) return 0.0;
  const double actual = std::min(amount, std::max(0.0, capacity - current_cargo));
  current_cargo = std::min(capacity, current_cargo + actual);
  return actual;
}

double Ship::unload(double amount) {
  if (amount <= 0.0) return 0.0;
  const double actual = std::min(amount, current_cargo);
  current_cargo = std::max(0.0, current_cargo - actual);
  return actual;
}

double Ship::travel_to(const std::string& destination, const DistanceMatrix& distances, double now) {
  const double distance = distances.at(current_location, destination);
  const double arrival = now + distance / speed;

  Journey j;
  j.departure = current_location;
  j.destination = destination;
  j.departure_time = now;
  j.arrival_time = arrival;
  j.cargo = current_cargo;
  travel_history.push_back(std::move(j));

  current_location = destination;
  engage(ShipStatus::Traveling, arrival);
  return arrival;
}

bool Ship::is_available(double now) const {
  return status == ShipStatus::Idle && busy_until <= now && current_cargo > 0.0;
}

void Ship::engage(ShipStatus s, double until) {
  status = s;
  busy_until = std::max(busy_until, until);
}

void Ship::release(double now) {
  status = ShipStatus::Idle;
  busy_until = std::max(busy_until, now);
}

double CustomerSite::consume(double hours, double now) {
  const double demand = demand_for(hours);
  const double consumed = std::clamp(demand, 0.0, current_inventory);
  current_inventory -= consumed;
  if (current_inventory < 0.0) current_inventory = 0.0;

  InventoryRecord r;
  r.time = now;
  r.inventory_after = current_inventory;
  r.demand = demand;
  r.fulfilled = consumed;
  r.shortage = std::max(0.0, demand - consumed);
  inventory_history.push_back(r);
  return consumed;
}

double CustomerSite::receive_delivery(double amount, double now) {
  const double space = std::max(0.0, max_inventory - current_inventory);
  const double received = std::clamp(amount, 0.0, space);
  current_inventory = std::min(max_inventory, current_inventory + received);

  OrderRecord o;
  o.time = now;
  o.amount_requested = amount;
  o.amount_received = received;
  o.inventory_after = current_inventory;
  orders_history.push_back(o);
  return received;
}

double CustomerSite::days_of_supply() const {
  if (demand_rate <= 0.0) return std::numeric_limits<double>::infinity();
  return current_inventory / (demand_rate * 24.0);
}

Ship make_ship(const ShipSpec& spec, double speed_multiplier) {
  Ship s;
  s.id = spec.id;
  s.name = spec.name;
  s.capacity = spec.capacity;
  s.speed = spec.speed * speed_multiplier;
  s.current_location = spec.initial_location;
  s.current_cargo = std::clamp(spec.initial_cargo, 0.0, spec.capacity);
  return s;
}

CustomerSite make_customer(const CustomerSpec& spec) {
  CustomerSite c;
  c.id = spec.id;
  c.name = spec.name;
  c.location = spec.location;
  c.demand_rate = spec.demand_rate;
  c.current_inventory = std::clamp(spec.initial_inventory, 0.0, spec.max_inventory);
  c.min_inventory = spec.min_inventory;
  c.max_inventory = spec.max_inventory;
  return c;
}

const char* ship_status_label(ShipStatus s) {
  switch (s) {
    case ShipStatus::Idle: return "idle";
    case ShipStatus::Assigned: return "assigned";
    case ShipStatus::Traveling: return "traveling";
    case ShipStatus::Unloading: return "unloading";
    case ShipStatus::Waiting: return "waiting";
    case ShipStatus::Loading: return "loading";
  }
  return "idle";
}

} // namespace tidewater
