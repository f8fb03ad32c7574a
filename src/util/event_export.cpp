#include "tidewater/util/event_export.h"

#include <type_traits>
#include <variant>

#include "tidewater/core/serialization.h"
#include "tidewater/util/json.h"
#include "tidewater/util/strings.h"

namespace tidewater {
namespace {

struct CsvRow {
  std::string ship_id;
  std::string customer_id;
  std::string location;
  std::string amount;
  std::string detail;
};

std::string kv(const char* key, double v) { return std::string(key) + "=" + format_number(v); }

CsvRow row_for(const EventPayload& payload) {
  return std::visit(
      [](const auto& e) -> CsvRow {
        using T = std::decay_t<decltype(e)>;
        CsvRow r;
        if constexpr (std::is_same_v<T, ConsumptionEvent>) {
          r.customer_id = e.customer_id;
          r.amount = format_number(e.consumed);
          r.detail = kv("demand", e.demand) + ";" + kv("inventory", e.inventory_after) + ";" +
                     kv("days_of_supply", e.days_of_supply);
        } else if constexpr (std::is_same_v<T, DeliveryStartedEvent>) {
          r.ship_id = e.ship_id;
          r.customer_id = e.customer_id;
          r.amount = format_number(e.requested);
          r.detail = kv("ship_cargo", e.available_cargo);
        } else if constexpr (std::is_same_v<T, ShipArrivedEvent>) {
          r.ship_id = e.ship_id;
          r.customer_id = e.customer_id;
          r.location = e.location;
        } else if constexpr (std::is_same_v<T, DeliveryCompletedEvent>) {
          r.ship_id = e.ship_id;
          r.customer_id = e.customer_id;
          r.amount = format_number(e.received);
          r.detail = kv("unloaded", e.unloaded) + ";" + kv("customer_inventory", e.customer_inventory) + ";" +
                     kv("ship_cargo", e.ship_remaining_cargo);
        } else if constexpr (std::is_same_v<T, DeliveryFailedEvent>) {
          r.customer_id = e.customer_id;
          r.amount = format_number(e.needed);
          r.detail = std::string("reason=") + delivery_failure_reason_name(e.reason);
        } else if constexpr (std::is_same_v<T, ResupplyStartedEvent>) {
          r.ship_id = e.ship_id;
          r.location = e.from_location;
          r.amount = format_number(e.cargo);
          r.detail = "port=" + e.port;
        } else if constexpr (std::is_same_v<T, ResupplyCompletedEvent>) {
          r.ship_id = e.ship_id;
          r.location = e.location;
          r.amount = format_number(e.cargo);
        } else if constexpr (std::is_same_v<T, ProcessFailedEvent>) {
          r.ship_id = e.ship_id;
          r.customer_id = e.customer_id;
          r.detail = "process=" + e.process + ";error=" + e.error;
        }
        return r;
      },
      payload);
}

} // namespace

std::string events_to_csv(const std::vector<SimEvent>& events) {
  std::string csv = "seq,time,type,ship_id,customer_id,location,amount,detail\n";
  csv.reserve(csv.size() + events.size() * 64);

  for (const auto& ev : events) {
    const CsvRow r = row_for(ev.payload);
    csv += std::to_string(static_cast<unsigned long long>(ev.seq));
    csv += ",";
    csv += format_number(ev.time);
    csv += ",";
    csv += event_type_name(ev.payload);
    csv += ",";
    csv += csv_escape(r.ship_id);
    csv += ",";
    csv += csv_escape(r.customer_id);
    csv += ",";
    csv += csv_escape(r.location);
    csv += ",";
    csv += r.amount;
    csv += ",";
    csv += csv_escape(r.detail);
    csv += "\n";
  }
  return csv;
}

std::string events_to_jsonl(const std::vector<SimEvent>& events) {
  std::string out;
  for (const auto& ev : events) {
    out += json::stringify(event_to_json(ev), 0);
    out += "\n";
  }
  return out;
}

} // namespace tidewater
