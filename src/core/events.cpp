#include "tidewater/core/events.h"

#include <type_traits>
#include <utility>

namespace tidewater {

const SimEvent& EventLog::push(double time, EventPayload payload) {
  SimEvent ev;
  ev.seq = next_seq_++;
  ev.time = time;
  ev.payload = std::move(payload);
  events_.push_back(std::move(ev));
  return events_.back();
}

const char* event_type_name(const EventPayload& payload) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ConsumptionEvent>) {
          return "consumption";
        } else if constexpr (std::is_same_v<T, DeliveryStartedEvent>) {
          return "delivery_started";
        } else if constexpr (std::is_same_v<T, ShipArrivedEvent>) {
          return "ship_arrived";
        } else if constexpr (std::is_same_v<T, DeliveryCompletedEvent>) {
          return "delivery_completed";
        } else if constexpr (std::is_same_v<T, DeliveryFailedEvent>) {
          return "delivery_failed";
        } else if constexpr (std::is_same_v<T, ResupplyStartedEvent>) {
          return "resupply_started";
        } else if constexpr (std::is_same_v<T, ResupplyCompletedEvent>) {
          return "resupply_completed";
        } else {
          static_assert(std::is_same_v<T, ProcessFailedEvent>, "unhandled event type");
          return "process_failed";
        }
      },
      payload);
}

const char* delivery_failure_reason_name(DeliveryFailureReason r) {
  switch (r) {
    case DeliveryFailureReason::NoShipsAvailable: return "no_ships_available";
  }
  return "no_ships_available";
}

} // namespace tidewater
