#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tidewater {

struct ConsumptionEvent {
  std::string customer_id;
  double demand{0.0};
  double consumed{0.0};
  double inventory_after{0.0};
  double days_of_supply{0.0}; // may be +inf
};

struct DeliveryStartedEvent {
  std::string ship_id;
  std::string customer_id;
  double requested{0.0};
  double available_cargo{0.0};
};

struct ShipArrivedEvent {
  std::string ship_id;
  std::string location;
  std::string customer_id; // empty for port arrivals
};

struct DeliveryCompletedEvent {
  std::string ship_id;
  std::string customer_id;
  double unloaded{0.0};
  double received{0.0}; // unloaded minus whatever did not fit under max_inventory
  double customer_inventory{0.0};
  double ship_remaining_cargo{0.0};
};

enum class DeliveryFailureReason { NoShipsAvailable };

struct DeliveryFailedEvent {
  std::string customer_id;
  DeliveryFailureReason reason{DeliveryFailureReason::NoShipsAvailable};
  double needed{0.0};
};

struct ResupplyStartedEvent {
  std::string ship_id;
  std::string from_location;
  std::string port;
  double cargo{0.0};
};

struct ResupplyCompletedEvent {
  std::string ship_id;
  std::string location;
  double cargo{0.0};
};

// A process aborted by a ProcessError (e.g. RouteNotFound). Only that process stops.
struct ProcessFailedEvent {
  std::string process;
  std::string ship_id;
  std::string customer_id;
  std::string error;
};

using EventPayload = std::variant<ConsumptionEvent, DeliveryStartedEvent, ShipArrivedEvent,
                                  DeliveryCompletedEvent, DeliveryFailedEvent, ResupplyStartedEvent,
                                  ResupplyCompletedEvent, ProcessFailedEvent>;

struct SimEvent {
  // Emission index within a run, starting at 1.
  std::uint64_t seq{0};
  double time{0.0};
  EventPayload payload;
};

// Append-only record of domain events.
class EventLog {
 public:
  const SimEvent& push(double time, EventPayload payload);

  const std::vector<SimEvent>& events() const { return events_; }
  std::size_t size() const { return events_.size(); }
  bool empty() const { return events_.empty(); }

 private:
  std::vector<SimEvent> events_;
  std::uint64_t next_seq_{1};
};

// "consumption", "delivery_started", ...
const char* event_type_name(const EventPayload& payload);
const char* delivery_failure_reason_name(DeliveryFailureReason r);

// Counts events whose payload holds T.
template <typename T>
std::size_t count_events(const std::vector<SimEvent>& events) {
  std::size_t n = 0;
  for (const auto& ev : events) {
    if (std::holds_alternative<T>(ev.payload)) ++n;
  }
  return n;
}

} // namespace tidewater
