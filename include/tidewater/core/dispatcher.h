#pragma once

#include <map>
#include <optional>
#include <string>

#include "tidewater/core/entities.h"

namespace tidewater {

struct SimContext;

enum class DispatchOutcome {
  // Inventory already at or above the delivery target.
  NotNeeded,
  // No idle ship with cargo; a delivery_failed event was recorded.
  NoShipAvailable,
  Dispatched,
};

struct DispatchResult {
  DispatchOutcome outcome{DispatchOutcome::NotNeeded};
  std::string ship_id;
  double needed{0.0};
};

// Amount that would bring the customer up to target_fraction * max_inventory (may be <= 0).
double delivery_need(const CustomerSite& customer, double target_fraction);

// Pick the available ship (Ship::is_available) holding the most cargo.
//
// Exact cargo ties go to the lexicographically smallest ship id. Returns std::nullopt
// when no ship is available.
std::optional<std::string> select_ship_for_delivery(const std::map<std::string, Ship>& ships, double now);

// Try to send a ship to `customer_id`.
//
// The chosen ship is marked Assigned before this returns, so a second dispatch at the
// same instant cannot pick it again. The delivery itself runs as a separate process
// queued at the current time. There is no retry: a customer still short on its next
// consumption tick simply asks again.
DispatchResult dispatch_delivery(SimContext& ctx, const std::string& customer_id);

} // namespace tidewater
