#include "tidewater/core/dispatcher.h"

#include <memory>

#include "tidewater/core/context.h"
#include "tidewater/core/processes.h"
#include "tidewater/util/log.h"
#include "tidewater/util/strings.h"

namespace tidewater {

double delivery_need(const CustomerSite& customer, double target_fraction) {
  return customer.max_inventory * target_fraction - customer.current_inventory;
}

std::optional<std::string> select_ship_for_delivery(const std::map<std::string, Ship>& ships, double now) {
  const Ship* best = nullptr;
  // Ascending id order + strict comparison = lowest id wins ties.
  for (const auto& [_, ship] : ships) {
    if (!ship.is_available(now)) continue;
    if (!best || ship.current_cargo > best->current_cargo) best = &ship;
  }
  if (!best) return std::nullopt;
  return best->id;
}

DispatchResult dispatch_delivery(SimContext& ctx, const std::string& customer_id) {
  DispatchResult res;
  const CustomerSite& customer = ctx.customer(customer_id);
  res.needed = delivery_need(customer, ctx.params.delivery_target_fraction);
  if (res.needed <= 0.0) return res;

  const auto pick = select_ship_for_delivery(ctx.state.ships, ctx.now());
  if (!pick) {
    res.outcome = DispatchOutcome::NoShipAvailable;
    DeliveryFailedEvent ev;
    ev.customer_id = customer_id;
    ev.reason = DeliveryFailureReason::NoShipsAvailable;
    ev.needed = res.needed;
    ctx.emit(std::move(ev));
    log::debug("No ship available for " + customer_id + " at t=" + format_number(ctx.now()));
    return res;
  }

  Ship& ship = ctx.ship(*pick);
  ship.engage(ShipStatus::Assigned, ctx.now());
  ctx.start(std::make_unique<DeliveryProcess>(ship.id, customer_id, res.needed));

  res.outcome = DispatchOutcome::Dispatched;
  res.ship_id = ship.id;
  log::debug("Dispatched " + ship.id + " to " + customer_id + " for " + format_number(res.needed) +
             " units at t=" + format_number(ctx.now()));
  return res;
}

} // namespace tidewater
