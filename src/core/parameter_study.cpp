#include "tidewater/core/parameter_study.h"

#include <utility>

#include "tidewater/core/data_source.h"
#include "tidewater/core/simulation.h"
#include "tidewater/util/log.h"

namespace tidewater {

std::vector<StudyRun> run_parameter_study(const ScenarioConfig& base, const std::string& param_name,
                                          const std::vector<json::Value>& values, DataSource* sink) {
  std::vector<StudyRun> runs;
  runs.reserve(values.size());

  for (const auto& value : values) {
    log::info("Running simulation with " + param_name + " = " + json::stringify(value, 0));

    ParamOverrides overrides;
    overrides[param_name] = value;
    Simulation sim(base, overrides);
    SimResults results = sim.run();
    if (sink) publish_results(*sink, results);

    StudyRun run;
    run.param_name = param_name;
    run.param_value = value;
    run.metrics = std::move(results.metrics);
    runs.push_back(std::move(run));
  }
  return runs;
}

} // namespace tidewater
