#include "tidewater/core/data_source.h"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

#include "tidewater/core/errors.h"
#include "tidewater/core/serialization.h"
#include "tidewater/util/file_io.h"
#include "tidewater/util/log.h"
#include "tidewater/util/time.h"

namespace tidewater {
namespace {

constexpr const char* kShipsFile = "ships.json";
constexpr const char* kCustomersFile = "customers.json";
constexpr const char* kDistancesFile = "distances.json";
constexpr const char* kParamsFile = "simulation_params.json";

json::Value load_json_file(const std::string& path) {
  if (!file_exists(path)) throw MalformedConfiguration("Missing scenario file: " + path);
  try {
    return json::parse(read_text_file(path));
  } catch (const std::runtime_error& e) {
    throw MalformedConfiguration(path + ": " + e.what());
  }
}

} // namespace

JsonDirectorySource::JsonDirectorySource(std::string dir) : dir_(std::move(dir)) {}

ScenarioConfig JsonDirectorySource::load_scenario() {
  ScenarioConfig cfg;
  cfg.ships = ships_from_json(load_json_file(join_path(dir_, kShipsFile)));
  cfg.customers = customers_from_json(load_json_file(join_path(dir_, kCustomersFile)));
  cfg.distances = distances_from_json(load_json_file(join_path(dir_, kDistancesFile)));
  cfg.params = params_from_json(load_json_file(join_path(dir_, kParamsFile)));
  log::debug("Loaded scenario from " + dir_ + ": " + std::to_string(cfg.ships.size()) + " ships, " +
             std::to_string(cfg.customers.size()) + " customers");
  return cfg;
}

std::string JsonDirectorySource::save_results(const json::Value& document) {
  const std::string stamp = format_file_stamp_utc(std::chrono::system_clock::now());
  std::string path = join_path(dir_, "results_" + stamp + ".json");
  // Several runs may finish within the same second (parameter studies).
  for (int n = 2; file_exists(path); ++n) {
    path = join_path(dir_, "results_" + stamp + "_" + std::to_string(n) + ".json");
  }
  write_text_file(path, json::stringify(document, 2) + "\n");
  return path;
}

void write_scenario(const std::string& dir, const ScenarioConfig& cfg) {
  ensure_dir(dir);
  write_text_file(join_path(dir, kShipsFile), json::stringify(ships_to_json(cfg.ships), 2) + "\n");
  write_text_file(join_path(dir, kCustomersFile), json::stringify(customers_to_json(cfg.customers), 2) + "\n");
  write_text_file(join_path(dir, kDistancesFile), json::stringify(distances_to_json(cfg.distances), 2) + "\n");
  write_text_file(join_path(dir, kParamsFile), json::stringify(params_to_json(cfg.params), 2) + "\n");
}

bool publish_results(DataSource& sink, const SimResults& results) {
  try {
    const std::string where = sink.save_results(results_to_json(results));
    if (!where.empty()) log::info("Results saved to " + where);
    return true;
  } catch (const std::exception& e) {
    log::warn(std::string("Failed to save results: ") + e.what());
    return false;
  }
}

} // namespace tidewater
