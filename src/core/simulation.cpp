#include "tidewater/core/simulation.h"

#include <algorithm>
#include <memory>
#include <set>
#include <stdexcept>
#include <utility>

#include "tidewater/core/errors.h"
#include "tidewater/core/processes.h"
#include "tidewater/util/log.h"
#include "tidewater/util/strings.h"
#include "tidewater/util/time.h"

namespace tidewater {

Simulation::Simulation(ScenarioConfig cfg, const ParamOverrides& overrides) : cfg_(std::move(cfg)) {
  apply_param_overrides(cfg_.params, overrides);
}

SimContext Simulation::context() {
  return SimContext{cfg_.params, cfg_.distances, state_, scheduler_};
}

void Simulation::setup() {
  if (set_up_) return;

  const auto errors = validate_scenario(cfg_);
  if (!errors.empty()) {
    std::string msg = "Invalid scenario (" + std::to_string(errors.size()) + " problem(s)):";
    for (const auto& e : errors) msg += "\n  - " + e;
    throw MalformedConfiguration(msg);
  }

  wall_start_ = std::chrono::system_clock::now();
  steady_start_ = std::chrono::steady_clock::now();

  state_ = SimState{};
  for (const auto& spec : cfg_.ships) {
    Ship s = make_ship(spec, cfg_.params.ship_speed_multiplier);
    state_.ships.emplace(s.id, std::move(s));
  }
  for (const auto& spec : cfg_.customers) {
    CustomerSite c = make_customer(spec);
    state_.customers.emplace(c.id, std::move(c));
  }

  // Unknown locations are not fatal here; the first trip touching one fails with RouteNotFound.
  std::set<std::string> referenced;
  referenced.insert(cfg_.params.port_location);
  for (const auto& [_, s] : state_.ships) referenced.insert(s.current_location);
  for (const auto& [_, c] : state_.customers) referenced.insert(c.location);
  for (const auto& loc : referenced) {
    if (!cfg_.distances.has_location(loc)) log::warn("Location '" + loc + "' is missing from the distance matrix");
  }

  scheduler_.set_failure_handler([this](const Process& p, const ProcessError& e) {
    ProcessFailedEvent ev;
    ev.process = p.kind();
    ev.ship_id = p.ship_id();
    ev.customer_id = p.customer_id();
    ev.error = e.what();
    state_.events.push(scheduler_.now(), std::move(ev));
  });

  for (const auto& [id, _] : state_.customers) scheduler_.start(std::make_unique<ConsumptionProcess>(id));

  set_up_ = true;
  log::info("Simulation set up: " + std::to_string(state_.ships.size()) + " ships, " +
            std::to_string(state_.customers.size()) + " customers, horizon " +
            format_duration_hours(cfg_.params.simulation_duration));
}

void Simulation::advance_until(double t) {
  if (finished_) return;
  setup();
  const double target = std::min(t, cfg_.params.simulation_duration);
  SimContext ctx = context();
  scheduler_.run_until(ctx, target);
}

SimResults Simulation::run() {
  if (finished_) throw std::runtime_error("Simulation::run called on a finished simulation");

  setup();
  advance_until(cfg_.params.simulation_duration);
  const std::size_t dropped = scheduler_.pending();
  scheduler_.discard_pending();
  finished_ = true;

  SimResults r;
  const auto wall_end = std::chrono::system_clock::now();
  r.metadata.start_time = format_iso8601_utc(wall_start_);
  r.metadata.end_time = format_iso8601_utc(wall_end);
  r.metadata.duration_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - steady_start_).count();

  r.params = cfg_.params;
  r.metrics = compute_metrics(cfg_.params, cfg_.distances, state_);
  r.events = state_.events.events();
  r.ships = state_.ships;
  r.customers = state_.customers;

  log::info("Simulation finished at t=" + format_number(scheduler_.now()) + "h: " +
            std::to_string(r.events.size()) + " events, " + std::to_string(scheduler_.steps_run()) +
            " steps, " + std::to_string(dropped) + " resumptions past the horizon, service level " +
            format_number(r.metrics.overall_service_level));
  return r;
}

} // namespace tidewater
