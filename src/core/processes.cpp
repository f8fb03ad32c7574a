#include "tidewater/core/processes.h"

#include <algorithm>
#include <memory>
#include <utility>

#include "tidewater/core/context.h"
#include "tidewater/core/dispatcher.h"

namespace tidewater {

ConsumptionProcess::ConsumptionProcess(std::string customer_id) : customer_id_(std::move(customer_id)) {}

std::optional<double> ConsumptionProcess::step(SimContext& ctx) {
  const double dt = ctx.params.time_step;
  if (phase_ == Phase::Start) {
    phase_ = Phase::Tick;
    return dt;
  }

  CustomerSite& c = ctx.customer(customer_id_);
  const double demand = c.demand_for(dt);
  const double consumed = c.consume(dt, ctx.now());
  const double dos = c.days_of_supply();

  ConsumptionEvent ev;
  ev.customer_id = customer_id_;
  ev.demand = demand;
  ev.consumed = consumed;
  ev.inventory_after = c.current_inventory;
  ev.days_of_supply = dos;
  ctx.emit(std::move(ev));

  if (dos < ctx.params.resupply_threshold_days) dispatch_delivery(ctx, customer_id_);
  return dt;
}

DeliveryProcess::DeliveryProcess(std::string ship_id, std::string customer_id, double needed)
    : ship_id_(std::move(ship_id)), customer_id_(std::move(customer_id)), needed_(needed) {}

std::optional<double> DeliveryProcess::step(SimContext& ctx) {
  Ship& ship = ctx.ship(ship_id_);
  CustomerSite& customer = ctx.customer(customer_id_);

  switch (phase_) {
    case Phase::Depart: {
      DeliveryStartedEvent ev;
      ev.ship_id = ship_id_;
      ev.customer_id = customer_id_;
      ev.requested = needed_;
      ev.available_cargo = ship.current_cargo;
      ctx.emit(std::move(ev));

      const double arrival = ship.travel_to(customer.location, ctx.distances, ctx.now());
      phase_ = Phase::Arrive;
      return arrival - ctx.now();
    }

    case Phase::Arrive: {
      ShipArrivedEvent ev;
      ev.ship_id = ship_id_;
      ev.location = customer.location;
      ev.customer_id = customer_id_;
      ctx.emit(std::move(ev));

      delivery_amount_ = std::min(needed_, ship.current_cargo);
      const double unload_hours = delivery_amount_ / ctx.params.unloading_rate;
      ship.engage(ShipStatus::Unloading, ctx.now() + unload_hours);
      phase_ = Phase::Unload;
      return unload_hours;
    }

    case Phase::Unload: {
      const double unloaded = ship.unload(delivery_amount_);
      const double received = customer.receive_delivery(unloaded, ctx.now());

      DeliveryCompletedEvent ev;
      ev.ship_id = ship_id_;
      ev.customer_id = customer_id_;
      ev.unloaded = unloaded;
      ev.received = received;
      ev.customer_inventory = customer.current_inventory;
      ev.ship_remaining_cargo = ship.current_cargo;
      ctx.emit(std::move(ev));

      if (ship.current_cargo < ctx.params.resupply_cargo_fraction * ship.capacity) {
        ship.engage(ShipStatus::Assigned, ctx.now());
        ctx.start(std::make_unique<ResupplyProcess>(ship_id_));
      } else {
        ship.release(ctx.now());
      }
      return std::nullopt;
    }
  }
  return std::nullopt;
}

ResupplyProcess::ResupplyProcess(std::string ship_id) : ship_id_(std::move(ship_id)) {}

double ResupplyProcess::arrive_at_port(SimContext& ctx) {
  Ship& ship = ctx.ship(ship_id_);

  ShipArrivedEvent ev;
  ev.ship_id = ship_id_;
  ev.location = ctx.params.port_location;
  ctx.emit(std::move(ev));

  const double delay = ctx.params.port_resupply_delay;
  ship.engage(ShipStatus::Waiting, ctx.now() + delay);
  phase_ = Phase::Turnaround;
  return delay;
}

std::optional<double> ResupplyProcess::step(SimContext& ctx) {
  Ship& ship = ctx.ship(ship_id_);
  const std::string& port = ctx.params.port_location;

  switch (phase_) {
    case Phase::Depart: {
      ResupplyStartedEvent ev;
      ev.ship_id = ship_id_;
      ev.from_location = ship.current_location;
      ev.port = port;
      ev.cargo = ship.current_cargo;
      ctx.emit(std::move(ev));

      if (ship.current_location == port) return arrive_at_port(ctx);

      const double arrival = ship.travel_to(port, ctx.distances, ctx.now());
      phase_ = Phase::AtPort;
      return arrival - ctx.now();
    }

    case Phase::AtPort:
      return arrive_at_port(ctx);

    case Phase::Turnaround: {
      const double load_hours = (ship.capacity - ship.current_cargo) / ctx.params.loading_rate;
      ship.engage(ShipStatus::Loading, ctx.now() + load_hours);
      phase_ = Phase::Loaded;
      return load_hours;
    }

    case Phase::Loaded: {
      ship.load(ship.capacity - ship.current_cargo);

      ResupplyCompletedEvent ev;
      ev.ship_id = ship_id_;
      ev.location = ship.current_location;
      ev.cargo = ship.current_cargo;
      ctx.emit(std::move(ev));

      ship.release(ctx.now());
      return std::nullopt;
    }
  }
  return std::nullopt;
}

} // namespace tidewater
