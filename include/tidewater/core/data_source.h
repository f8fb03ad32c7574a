#pragma once

#include <string>

#include "tidewater/core/config.h"
#include "tidewater/core/simulation.h"
#include "tidewater/util/json.h"

namespace tidewater {

// Where scenarios come from and where results documents go.
class DataSource {
 public:
  virtual ~DataSource() = default;

  // Throws MalformedConfiguration when the scenario is missing or unreadable.
  virtual ScenarioConfig load_scenario() = 0;

  // Persist one results document. Returns a human-readable location (may be empty).
  // Throws std::runtime_error on I/O failure.
  virtual std::string save_results(const json::Value& document) = 0;
};

// A directory holding ships.json, customers.json, distances.json and
// simulation_params.json. Results land next to them as results_<stamp>.json.
class JsonDirectorySource final : public DataSource {
 public:
  explicit JsonDirectorySource(std::string dir);

  const std::string& dir() const { return dir_; }

  ScenarioConfig load_scenario() override;
  std::string save_results(const json::Value& document) override;

 private:
  std::string dir_;
};

// Write a scenario in the layout JsonDirectorySource reads. Creates `dir` if needed.
void write_scenario(const std::string& dir, const ScenarioConfig& cfg);

// Serialize `results` and hand it to `sink`. Failures are logged as warnings and
// reported through the return value; they never invalidate the results.
bool publish_results(DataSource& sink, const SimResults& results);

} // namespace tidewater
