#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "tidewater/core/config.h"
#include "tidewater/core/context.h"
#include "tidewater/core/metrics.h"
#include "tidewater/core/scheduler.h"

namespace tidewater {

struct RunMetadata {
  std::string start_time; // ISO-8601 UTC wall clock
  std::string end_time;
  double duration_seconds{0.0};
};

// Everything a finished run hands to the results sink.
struct SimResults {
  RunMetadata metadata;
  SimParams params;
  std::vector<SimEvent> events;
  SimMetrics metrics;
  std::map<std::string, Ship> ships;
  std::map<std::string, CustomerSite> customers;
};

// One simulation run over a configuration snapshot.
//
// Instances are single-use: entities are built fresh in setup() and discarded with
// the instance, so two runs never share mutable state.
class Simulation {
 public:
  // Overrides are applied on top of cfg.params before anything else happens.
  // Throws MalformedConfiguration for ill-typed override values.
  explicit Simulation(ScenarioConfig cfg, const ParamOverrides& overrides = {});

  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  const SimParams& params() const { return cfg_.params; }
  const ScenarioConfig& config() const { return cfg_; }

  SimState& state() { return state_; }
  const SimState& state() const { return state_; }

  const Scheduler& scheduler() const { return scheduler_; }
  double now() const { return scheduler_.now(); }

  // Validate the snapshot, build entities and queue one consumption process per customer.
  // Throws MalformedConfiguration listing every problem found. Called implicitly by
  // advance_until() and run().
  void setup();
  bool is_set_up() const { return set_up_; }

  // Run every resumption due at or before `t` (clamped to the horizon).
  void advance_until(double t);

  // Run to the horizon, drop whatever is still pending, and collect results.
  // Throws std::runtime_error when called a second time.
  SimResults run();

 private:
  SimContext context();

  ScenarioConfig cfg_;
  SimState state_;
  Scheduler scheduler_;
  bool set_up_{false};
  bool finished_{false};

  std::chrono::system_clock::time_point wall_start_;
  std::chrono::steady_clock::time_point steady_start_;
};

} // namespace tidewater
