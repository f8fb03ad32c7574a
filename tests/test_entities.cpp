#include <cmath>
#include <iostream>
#include <string>

#include "tidewater/core/entities.h"
#include "tidewater/core/errors.h"

#define TW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

tidewater::Ship make_test_ship() {
  tidewater::ShipSpec spec;
  spec.id = "ship_1";
  spec.name = "Vessel Alpha";
  spec.capacity = 1000.0;
  spec.speed = 20.0;
  spec.initial_location = "port_main";
  spec.initial_cargo = 600.0;
  return tidewater::make_ship(spec, 1.0);
}

} // namespace

int test_entities() {
  using namespace tidewater;

  // Cargo transfers clamp to what fits / what is on board.
  {
    Ship s = make_test_ship();
    TW_ASSERT(near(s.load(0.0), 0.0));
    TW_ASSERT(near(s.unload(0.0), 0.0));
    TW_ASSERT(near(s.load(-5.0), 0.0));
    TW_ASSERT(near(s.current_cargo, 600.0));

    TW_ASSERT(near(s.load(1000.0), 400.0));
    TW_ASSERT(near(s.current_cargo, 1000.0));
    TW_ASSERT(near(s.unload(250.0), 250.0));
    TW_ASSERT(near(s.unload(5000.0), 750.0));
    TW_ASSERT(near(s.current_cargo, 0.0));
  }

  // Initial cargo is clamped into [0, capacity]; the speed multiplier applies at construction.
  {
    ShipSpec spec;
    spec.id = "ship_2";
    spec.capacity = 500.0;
    spec.speed = 10.0;
    spec.initial_location = "port_main";
    spec.initial_cargo = 900.0;
    const Ship s = make_ship(spec, 1.5);
    TW_ASSERT(near(s.current_cargo, 500.0));
    TW_ASSERT(near(s.speed, 15.0));
    TW_ASSERT(s.status == ShipStatus::Idle);
  }

  // Travel records the journey and keeps the ship busy until arrival.
  {
    DistanceMatrix m;
    m.set("port_main", "site_a", 200.0);
    Ship s = make_test_ship();
    const double arrival = s.travel_to("site_a", m, 5.0);
    TW_ASSERT(near(arrival, 15.0));
    TW_ASSERT(s.current_location == "site_a");
    TW_ASSERT(near(s.busy_until, 15.0));
    TW_ASSERT(s.status == ShipStatus::Traveling);
    TW_ASSERT(s.travel_history.size() == 1);
    TW_ASSERT(s.travel_history[0].departure == "port_main");
    TW_ASSERT(s.travel_history[0].destination == "site_a");
    TW_ASSERT(near(s.travel_history[0].departure_time, 5.0));
    TW_ASSERT(near(s.travel_history[0].arrival_time, 15.0));
    TW_ASSERT(near(s.travel_history[0].cargo, 600.0));
    TW_ASSERT(!s.is_available(20.0));

    s.release(20.0);
    TW_ASSERT(s.is_available(20.0));
    TW_ASSERT(!s.is_available(19.0));
  }

  // A missing leg throws before anything about the ship changes.
  {
    DistanceMatrix m;
    m.set("port_main", "site_a", 200.0);
    Ship s = make_test_ship();
    bool threw = false;
    try {
      (void)s.travel_to("site_z", m, 0.0);
    } catch (const RouteNotFound& e) {
      threw = true;
      TW_ASSERT(e.from() == "port_main");
      TW_ASSERT(e.to() == "site_z");
    }
    TW_ASSERT(threw);
    TW_ASSERT(s.current_location == "port_main");
    TW_ASSERT(s.travel_history.empty());
    TW_ASSERT(s.status == ShipStatus::Idle);

    // No implicit zero-length self leg either.
    TW_ASSERT(!m.find("port_main", "port_main").has_value());
  }

  // Empty ships are never dispatch-eligible.
  {
    Ship s = make_test_ship();
    s.unload(s.current_cargo);
    TW_ASSERT(!s.is_available(0.0));
  }

  // busy_until never moves backwards.
  {
    Ship s = make_test_ship();
    s.engage(ShipStatus::Unloading, 10.0);
    s.engage(ShipStatus::Assigned, 4.0);
    TW_ASSERT(near(s.busy_until, 10.0));
    TW_ASSERT(s.status == ShipStatus::Assigned);
  }

  TW_ASSERT(std::string(ship_status_label(ShipStatus::Idle)) == "idle");
  TW_ASSERT(std::string(ship_status_label(ShipStatus::Assigned)) == "assigned");
  TW_ASSERT(std::string(ship_status_label(ShipStatus::Unloading)) == "unloading");
  TW_ASSERT(std::string(ship_status_label(ShipStatus::Loading)) == "loading");

  // Consumption clamps at zero and records the shortage.
  {
    CustomerSpec spec;
    spec.id = "customer_1";
    spec.location = "site_a";
    spec.demand_rate = 100.0;
    spec.initial_inventory = 150.0;
    spec.min_inventory = 50.0;
    spec.max_inventory = 1000.0;
    CustomerSite c = make_customer(spec);

    TW_ASSERT(near(c.consume(1.0, 1.0), 100.0));
    TW_ASSERT(near(c.current_inventory, 50.0));
    TW_ASSERT(near(c.consume(1.0, 2.0), 50.0));
    TW_ASSERT(near(c.current_inventory, 0.0));
    TW_ASSERT(c.inventory_history.size() == 2);
    TW_ASSERT(near(c.inventory_history[1].time, 2.0));
    TW_ASSERT(near(c.inventory_history[1].demand, 100.0));
    TW_ASSERT(near(c.inventory_history[1].fulfilled, 50.0));
    TW_ASSERT(near(c.inventory_history[1].shortage, 50.0));
    TW_ASSERT(near(c.days_of_supply(), 0.0));

    // Deliveries only fill up to max_inventory.
    TW_ASSERT(near(c.receive_delivery(600.0, 3.0), 600.0));
    TW_ASSERT(near(c.receive_delivery(600.0, 4.0), 400.0));
    TW_ASSERT(near(c.current_inventory, 1000.0));
    TW_ASSERT(c.orders_history.size() == 2);
    TW_ASSERT(near(c.orders_history[1].amount_requested, 600.0));
    TW_ASSERT(near(c.orders_history[1].amount_received, 400.0));

    TW_ASSERT(near(c.days_of_supply(), 1000.0 / 2400.0));
  }

  // Initial inventory above the cap is clamped; zero demand means unlimited supply.
  {
    CustomerSpec spec;
    spec.id = "customer_2";
    spec.location = "site_b";
    spec.demand_rate = 0.0;
    spec.initial_inventory = 5000.0;
    spec.max_inventory = 3000.0;
    CustomerSite c = make_customer(spec);
    TW_ASSERT(near(c.current_inventory, 3000.0));
    TW_ASSERT(std::isinf(c.days_of_supply()));
    TW_ASSERT(near(c.consume(1.0, 1.0), 0.0));
    TW_ASSERT(near(c.current_inventory, 3000.0));
  }

  return 0;
}
