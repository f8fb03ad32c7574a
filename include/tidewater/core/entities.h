#pragma once

#include <string>
#include <vector>

#include "tidewater/core/config.h"
#include "tidewater/core/distance_matrix.h"

namespace tidewater {

enum class ShipStatus {
  Idle,
  // Picked by the dispatcher; its delivery process has not run yet.
  Assigned,
  Traveling,
  Unloading,
  // Port turnaround before loading.
  Waiting,
  Loading,
};

struct Journey {
  std::string departure;
  std::string destination;
  double departure_time{0.0};
  double arrival_time{0.0};
  double cargo{0.0};
};

struct Ship {
  std::string id;
  std::string name;
  double capacity{0.0};
  double speed{0.0}; // distance units per hour
  std::string current_location;
  double current_cargo{0.0};

  // Simulated time at which the ship becomes available again.
  double busy_until{0.0};
  ShipStatus status{ShipStatus::Idle};

  std::vector<Journey> travel_history;

  // Adds min(amount, capacity - cargo). Returns the amount actually loaded.
  double load(double amount);

  // Removes min(amount, cargo). Returns the amount actually unloaded.
  double unload(double amount);

  // Records the journey and moves the ship. Returns the arrival time.
  //
  // Throws RouteNotFound if the distance matrix has no current_location -> destination leg;
  // the ship is left untouched in that case.
  double travel_to(const std::string& destination, const DistanceMatrix& distances, double now);

  bool is_available(double now) const;

  // Marks the ship engaged; busy_until never moves backwards.
  void engage(ShipStatus s, double until);

  // Back to the idle pool as of `now`.
  void release(double now);
};

struct InventoryRecord {
  double time{0.0};
  double inventory_after{0.0};
  double demand{0.0};
  double fulfilled{0.0};
  double shortage{0.0};
};

struct OrderRecord {
  double time{0.0};
  double amount_requested{0.0};
  double amount_received{0.0};
  double inventory_after{0.0};
};

struct CustomerSite {
  std::string id;
  std::string name;
  std::string location;
  double demand_rate{0.0}; // units per hour
  double current_inventory{0.0};
  double min_inventory{0.0};
  double max_inventory{0.0};

  std::vector<InventoryRecord> inventory_history;
  std::vector<OrderRecord> orders_history;

  double demand_for(double hours) const { return demand_rate * hours; }

  // Consume one period's demand (never below zero) and append an inventory record
  // stamped with `now`. Returns the amount actually consumed.
  double consume(double hours, double now);

  // Accept up to the free capacity. Returns the amount actually received.
  double receive_delivery(double amount, double now);

  // Inventory / daily demand. Infinite when demand_rate <= 0.
  double days_of_supply() const;
};

Ship make_ship(const ShipSpec& spec, double speed_multiplier);
CustomerSite make_customer(const CustomerSpec& spec);

const char* ship_status_label(ShipStatus s);

} // namespace tidewater
