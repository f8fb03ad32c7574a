#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "tidewater/core/data_source.h"
#include "tidewater/core/errors.h"
#include "tidewater/core/scenario.h"
#include "tidewater/core/serialization.h"
#include "tidewater/core/simulation.h"
#include "tidewater/util/file_io.h"
#include "tidewater/util/json.h"

#include "tidewater_test.h"

#define TW_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::string malformed_message(const std::string& ships_text) {
  try {
    (void)tidewater::ships_from_json(tidewater::json::parse(ships_text));
  } catch (const tidewater::MalformedConfiguration& e) {
    return e.what();
  }
  return {};
}

class MemorySink final : public tidewater::DataSource {
 public:
  tidewater::ScenarioConfig load_scenario() override { return tidewater::test::single_lane_scenario(); }

  std::string save_results(const tidewater::json::Value& document) override {
    documents.push_back(document);
    return {};
  }

  std::vector<tidewater::json::Value> documents;
};

class BrokenSink final : public tidewater::DataSource {
 public:
  tidewater::ScenarioConfig load_scenario() override { return tidewater::test::single_lane_scenario(); }

  std::string save_results(const tidewater::json::Value&) override {
    throw std::runtime_error("disk full");
  }
};

} // namespace

int test_serialization() {
  using namespace tidewater;
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");
  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "tidewater_test_serialization";
  dir /= std::to_string(static_cast<long long>(nonce));

  // Scenario directory round trip.
  {
    const ScenarioConfig original = make_example_scenario(7);
    write_scenario(dir.string(), original);
    TW_ASSERT(file_exists((dir / "ships.json").string()));
    TW_ASSERT(file_exists((dir / "simulation_params.json").string()));

    JsonDirectorySource source(dir.string());
    const ScenarioConfig loaded = source.load_scenario();

    TW_ASSERT(loaded.ships.size() == original.ships.size());
    TW_ASSERT(loaded.customers.size() == original.customers.size());
    for (std::size_t i = 0; i < loaded.ships.size(); ++i) {
      TW_ASSERT(loaded.ships[i].id == original.ships[i].id);
      TW_ASSERT(loaded.ships[i].name == original.ships[i].name);
      TW_ASSERT(loaded.ships[i].capacity == original.ships[i].capacity);
      TW_ASSERT(loaded.ships[i].initial_cargo == original.ships[i].initial_cargo);
    }
    TW_ASSERT(loaded.customers[2].id == "customer_3");
    TW_ASSERT(loaded.customers[2].max_inventory == 144000.0);
    TW_ASSERT(loaded.distances.locations() == original.distances.locations());
    for (const auto& [from, row] : original.distances.rows()) {
      for (const auto& [to, d] : row) {
        const auto got = loaded.distances.find(from, to);
        TW_ASSERT(got.has_value());
        TW_ASSERT(std::fabs(*got - d) < 1e-6);
      }
    }
    TW_ASSERT(loaded.params.simulation_duration == 720.0);
    TW_ASSERT(loaded.params.random_seed == 7);
    TW_ASSERT(loaded.params.port_location == "port_main");

    // Results land beside the scenario, one file per save.
    const std::string first = source.save_results(json::parse("{\"a\": 1}"));
    const std::string second = source.save_results(json::parse("{\"a\": 2}"));
    TW_ASSERT(first != second);
    TW_ASSERT(fs::path(first).filename().string().rfind("results_", 0) == 0);
    TW_ASSERT(json::parse(read_text_file(second)).at("a").int_value() == 2);
  }

  // Missing files and malformed entries.
  {
    JsonDirectorySource empty((dir / "nothing_here").string());
    bool threw = false;
    try {
      (void)empty.load_scenario();
    } catch (const MalformedConfiguration& e) {
      threw = std::string(e.what()).find("ships.json") != std::string::npos;
    }
    TW_ASSERT(threw);

    const std::string msg = malformed_message("[{\"id\": \"s\", \"name\": \"S\", \"speed\": 5, \"initial_location\": \"p\"}]");
    TW_ASSERT(msg.find("ships.json[0]") != std::string::npos);
    TW_ASSERT(msg.find("capacity") != std::string::npos);

    const std::string typed =
        malformed_message("[{\"id\": \"s\", \"name\": \"S\", \"capacity\": \"big\", \"speed\": 5, \"initial_location\": \"p\"}]");
    TW_ASSERT(typed.find("must be a number") != std::string::npos);

    // initial_cargo is optional.
    const auto ships = ships_from_json(
        json::parse("[{\"id\": \"s\", \"name\": \"S\", \"capacity\": 10, \"speed\": 5, \"initial_location\": \"p\"}]"));
    TW_ASSERT(ships.size() == 1);
    TW_ASSERT(ships[0].initial_cargo == 0.0);

    bool params_threw = false;
    try {
      (void)params_from_json(json::parse("{\"time_step\": 1}"));
    } catch (const MalformedConfiguration& e) {
      params_threw = std::string(e.what()).find("simulation_duration") != std::string::npos;
    }
    TW_ASSERT(params_threw);

    const SimParams p = params_from_json(json::parse("{\"simulation_duration\": 24, \"time_step\": 0.5}"));
    TW_ASSERT(p.simulation_duration == 24.0);
    TW_ASSERT(p.time_step == 0.5);
    TW_ASSERT(p.loading_rate == 5000.0);
  }

  // Results document shape.
  {
    Simulation sim(test::single_lane_scenario(24.0));
    const SimResults r = sim.run();
    const json::Value doc = results_to_json(r);

    const auto& meta = doc.at("metadata");
    TW_ASSERT(meta.at("start_time").string_value().size() == 20);
    TW_ASSERT(meta.at("duration_seconds").number_value() >= 0.0);
    TW_ASSERT(meta.at("counts").at("ships").int_value() == 1);
    TW_ASSERT(meta.at("counts").at("customers").int_value() == 1);
    TW_ASSERT(meta.at("counts").at("events").int_value() == static_cast<std::int64_t>(r.events.size()));
    TW_ASSERT(meta.at("params").at("simulation_duration").number_value() == 24.0);

    const auto& events = doc.at("events").array();
    TW_ASSERT(events.size() == r.events.size());
    TW_ASSERT(events[0].at("type").string_value() == "consumption");
    TW_ASSERT(events[0].at("seq").int_value() == 1);
    TW_ASSERT(events[0].at("current_inventory").number_value() == 2300.0);

    const auto& metrics = doc.at("metrics");
    TW_ASSERT(metrics.at("customer_metrics").at("customer_1").at("service_level").number_value() == 1.0);
    TW_ASSERT(metrics.at("ship_metrics").at("ship_1").at("num_deliveries").int_value() == 1);
    TW_ASSERT(metrics.find("overall_service_level") != nullptr);

    TW_ASSERT(doc.at("ships_history").array().size() == 1);
    TW_ASSERT(doc.at("ships_history").at(0).at("destination").string_value() == "site_a");
    TW_ASSERT(doc.at("customers_history").array().size() == 24);

    // Consumption at zero demand carries an infinite days of supply, written as null.
    SimEvent ev;
    ev.seq = 1;
    ConsumptionEvent idle;
    idle.customer_id = "c";
    idle.days_of_supply = std::numeric_limits<double>::infinity();
    ev.payload = idle;
    const json::Value parsed = json::parse(json::stringify(event_to_json(ev), 0));
    TW_ASSERT(parsed.at("days_of_supply").is_null());

    // Persistence is best effort.
    MemorySink memory;
    TW_ASSERT(publish_results(memory, r));
    TW_ASSERT(memory.documents.size() == 1);
    TW_ASSERT(memory.documents[0].at("events").array().size() == r.events.size());

    BrokenSink broken;
    TW_ASSERT(!publish_results(broken, r));
  }

  fs::remove_all(dir, ec);
  return 0;
}
