#pragma once

#include <string>
#include <vector>

#include "tidewater/core/config.h"
#include "tidewater/core/metrics.h"
#include "tidewater/util/json.h"

namespace tidewater {

class DataSource;

struct StudyRun {
  std::string param_name;
  json::Value param_value;
  SimMetrics metrics;
};

// Run one independent simulation per value with the single override {param_name: value}.
//
// Each run copies `base` and builds its own entities, so the runs share no mutable state.
// When `sink` is non-null every run's results document is also handed to it (best effort).
std::vector<StudyRun> run_parameter_study(const ScenarioConfig& base, const std::string& param_name,
                                          const std::vector<json::Value>& values, DataSource* sink = nullptr);

} // namespace tidewater
