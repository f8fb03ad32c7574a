#include "tidewater/core/metrics.h"

#include <algorithm>
#include <variant>

namespace tidewater {
namespace {

struct InventoryAccum {
  double sum{0.0};
  double min{0.0};
  std::size_t count{0};
  int stockouts{0};
};

} // namespace

SimMetrics compute_metrics(const SimParams& params, const DistanceMatrix& distances, const SimState& state) {
  SimMetrics m;

  std::map<std::string, InventoryAccum> inv;
  std::map<std::string, double> received;

  for (const auto& [id, ship] : state.ships) {
    ShipMetrics sm;
    for (const auto& j : ship.travel_history) {
      if (const auto d = distances.find(j.departure, j.destination)) sm.total_distance += *d;
    }
    m.ship_metrics[id] = sm;
  }

  for (const auto& ev : state.events.events()) {
    if (const auto* c = std::get_if<ConsumptionEvent>(&ev.payload)) {
      auto& a = inv[c->customer_id];
      a.min = (a.count == 0) ? c->inventory_after : std::min(a.min, c->inventory_after);
      a.sum += c->inventory_after;
      ++a.count;
      if (c->inventory_after == 0.0) {
        ++a.stockouts;
        ++m.total_stockout_events;
      }
    } else if (const auto* d = std::get_if<DeliveryCompletedEvent>(&ev.payload)) {
      received[d->customer_id] += d->received;
      auto it = m.ship_metrics.find(d->ship_id);
      if (it != m.ship_metrics.end()) {
        it->second.num_deliveries += 1;
        it->second.total_delivered += d->unloaded;
      }
    } else if (const auto* r = std::get_if<ResupplyCompletedEvent>(&ev.payload)) {
      auto it = m.ship_metrics.find(r->ship_id);
      if (it != m.ship_metrics.end()) it->second.num_resupplies += 1;
    } else if (std::holds_alternative<DeliveryFailedEvent>(ev.payload)) {
      ++m.total_failed_dispatches;
    } else if (std::holds_alternative<ProcessFailedEvent>(ev.payload)) {
      ++m.total_process_failures;
    }
  }

  const double duration = params.simulation_duration;
  double service_sum = 0.0;
  for (const auto& [id, a] : inv) {
    CustomerMetrics cm;
    cm.avg_inventory = a.sum / static_cast<double>(a.count);
    cm.min_inventory = a.min;
    cm.stockout_events = a.stockouts;
    cm.stockout_hours = a.stockouts * params.time_step;
    cm.service_level = (duration > 0.0) ? 1.0 - cm.stockout_hours / duration : 1.0;

    if (const auto* site = find_ptr(state.customers, id)) {
      for (const auto& rec : site->inventory_history) cm.total_shortage += rec.shortage;
    }
    auto rit = received.find(id);
    if (rit != received.end()) cm.total_received = rit->second;

    service_sum += cm.service_level;
    m.customer_metrics[id] = cm;
  }

  if (!m.customer_metrics.empty()) {
    m.overall_service_level = service_sum / static_cast<double>(m.customer_metrics.size());
  }
  return m;
}

} // namespace tidewater
