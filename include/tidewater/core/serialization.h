#pragma once

#include <string>
#include <vector>

#include "tidewater/core/config.h"
#include "tidewater/core/events.h"
#include "tidewater/core/metrics.h"
#include "tidewater/core/parameter_study.h"
#include "tidewater/core/simulation.h"
#include "tidewater/util/json.h"

namespace tidewater {

// Scenario parts, in the shapes of ships.json / customers.json / distances.json /
// simulation_params.json. The *_from_json functions throw MalformedConfiguration
// naming the offending entry on missing or ill-typed fields.
std::vector<ShipSpec> ships_from_json(const json::Value& v);
std::vector<CustomerSpec> customers_from_json(const json::Value& v);
DistanceMatrix distances_from_json(const json::Value& v);

// simulation_duration and time_step are required; everything else falls back to
// the SimParams defaults. Unknown keys are logged and ignored.
SimParams params_from_json(const json::Value& v);

json::Value ships_to_json(const std::vector<ShipSpec>& ships);
json::Value customers_to_json(const std::vector<CustomerSpec>& customers);
json::Value distances_to_json(const DistanceMatrix& distances);
json::Value params_to_json(const SimParams& params);

// {"seq", "time", "type", ...payload fields}.
json::Value event_to_json(const SimEvent& ev);

json::Value metrics_to_json(const SimMetrics& m);

// The full results document: metadata, events, metrics, ships_history, customers_history.
json::Value results_to_json(const SimResults& r);

// [{"param_name", "param_value", "metrics"}, ...]
json::Value study_to_json(const std::vector<StudyRun>& runs);

} // namespace tidewater
