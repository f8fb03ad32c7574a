#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "tidewater/core/config.h"
#include "tidewater/core/context.h"

namespace tidewater {

struct CustomerMetrics {
  double avg_inventory{0.0};
  double min_inventory{0.0};
  int stockout_events{0};
  double stockout_hours{0.0};
  double service_level{1.0};

  // Unmet demand summed over the inventory history.
  double total_shortage{0.0};
  // Units accepted from delivery_completed events.
  double total_received{0.0};
};

struct ShipMetrics {
  double total_distance{0.0};
  int num_deliveries{0};
  int num_resupplies{0};
  double total_delivered{0.0};
};

struct SimMetrics {
  double overall_service_level{0.0};
  int total_stockout_events{0};
  int total_failed_dispatches{0};
  int total_process_failures{0};

  // Only customers with at least one consumption event appear here.
  std::map<std::string, CustomerMetrics> customer_metrics;
  // Every ship of the run.
  std::map<std::string, ShipMetrics> ship_metrics;
};

// Post-run aggregation over the event log and final entity state. Reads only.
SimMetrics compute_metrics(const SimParams& params, const DistanceMatrix& distances, const SimState& state);

} // namespace tidewater
