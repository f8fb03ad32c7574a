#include <cstdint>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tidewater/core/data_source.h"
#include "tidewater/core/entities.h"
#include "tidewater/core/parameter_study.h"
#include "tidewater/core/scenario.h"
#include "tidewater/core/serialization.h"
#include "tidewater/core/simulation.h"
#include "tidewater/util/event_export.h"
#include "tidewater/util/file_io.h"
#include "tidewater/util/json.h"
#include "tidewater/util/log.h"
#include "tidewater/util/strings.h"
#include "tidewater/util/time.h"

namespace {

#ifndef TIDEWATER_VERSION
#define TIDEWATER_VERSION "unknown"
#endif

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

std::vector<std::string> get_all_str_args(int argc, char** argv, const std::string& key) {
  std::vector<std::string> out;
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) out.push_back(argv[++i]);
  }
  return out;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

// Command-line values are JSON when they parse as JSON (numbers, true/false, quoted
// strings) and plain strings otherwise, so "--set port_location=harbor" works unquoted.
tidewater::json::Value parse_cli_value(const std::string& raw) {
  try {
    return tidewater::json::parse(raw);
  } catch (const std::runtime_error&) {
    return raw;
  }
}

void print_usage(const char* exe) {
  std::cout << "Tidewater CLI v" << TIDEWATER_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "tidewater_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --data DIR           Scenario directory (default: data/example)\n";
  std::cout << "  --init-example DIR   Write the example scenario to DIR and exit\n";
  std::cout << "  --seed N             Seed for the example distance matrix (default: 42)\n";
  std::cout << "  --set NAME=VALUE     Override a simulation parameter (repeatable)\n";
  std::cout << "  --study NAME         Run a parameter study over NAME (requires --values)\n";
  std::cout << "    --values V1,V2,... Values for the study\n";
  std::cout << "    --study-out PATH   Write the study results as JSON\n";
  std::cout << "  --out PATH           Write the results document to PATH instead of the data directory\n";
  std::cout << "  --no-save            Do not persist results\n";
  std::cout << "  --dump-events        Print the event log (JSON Lines) to stdout\n";
  std::cout << "  --export-events-csv PATH    Export the event log to CSV\n";
  std::cout << "  --export-events-jsonl PATH  Export the event log to JSON Lines\n";
  std::cout << "  --quiet              Suppress non-essential summary/status output (useful for scripts)\n";
  std::cout << "  --log-level LEVEL    debug|info|warn|error|off (default: info, warn with --quiet)\n";
  std::cout << "  -h, --help           Show this help\n";
  std::cout << "  --version            Print version and exit\n";
}

void print_summary(const tidewater::SimResults& r) {
  using tidewater::format_number;
  const auto& m = r.metrics;
  std::cout << "Simulated " << tidewater::format_duration_hours(r.params.simulation_duration) << ", "
            << r.events.size() << " events\n";
  std::cout << "  Overall service level: " << format_number(m.overall_service_level * 100.0) << "%\n";
  std::cout << "  Stockout events:       " << m.total_stockout_events << "\n";
  std::cout << "  Failed dispatches:     " << m.total_failed_dispatches << "\n";
  if (m.total_process_failures > 0) {
    std::cout << "  Process failures:      " << m.total_process_failures << "\n";
  }

  if (!m.customer_metrics.empty()) std::cout << "\nCustomers:\n";
  for (const auto& [id, c] : m.customer_metrics) {
    std::cout << "  " << id << ": service " << format_number(c.service_level * 100.0) << "%, avg inventory "
              << format_number(c.avg_inventory) << ", min " << format_number(c.min_inventory) << ", stockout "
              << format_number(c.stockout_hours) << "h\n";
  }

  if (!m.ship_metrics.empty()) std::cout << "\nShips:\n";
  for (const auto& [id, s] : m.ship_metrics) {
    std::cout << "  " << id << ": " << s.num_deliveries << " deliveries, " << s.num_resupplies
              << " resupplies, distance " << format_number(s.total_distance) << ", delivered "
              << format_number(s.total_delivered);
    const auto it = r.ships.find(id);
    if (it != r.ships.end()) std::cout << " (" << tidewater::ship_status_label(it->second.status) << ")";
    std::cout << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << TIDEWATER_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const bool quiet = has_flag(argc, argv, "--quiet");
    if (quiet) tidewater::log::set_level(tidewater::log::Level::Warn);
    if (has_kv_arg(argc, argv, "--log-level")) {
      const std::string raw = get_str_arg(argc, argv, "--log-level", "info");
      tidewater::log::Level lvl = tidewater::log::Level::Info;
      if (!tidewater::log::parse_level(raw, lvl)) {
        std::cerr << "Unknown --log-level: " << raw << "\n\n";
        print_usage(argv[0]);
        return 2;
      }
      tidewater::log::set_level(lvl);
    }

    const std::string data_dir = get_str_arg(argc, argv, "--data", "data/example");
    const std::string init_dir = get_str_arg(argc, argv, "--init-example", "");
    const std::string study_param = get_str_arg(argc, argv, "--study", "");
    const std::string study_values = get_str_arg(argc, argv, "--values", "");
    const std::string study_out = get_str_arg(argc, argv, "--study-out", "");
    const std::string out_path = get_str_arg(argc, argv, "--out", "");
    const std::string export_events_csv_path = get_str_arg(argc, argv, "--export-events-csv", "");
    const std::string export_events_jsonl_path = get_str_arg(argc, argv, "--export-events-jsonl", "");
    const bool no_save = has_flag(argc, argv, "--no-save");

    if (!init_dir.empty()) {
      const std::uint64_t seed = std::stoull(get_str_arg(argc, argv, "--seed", "42"));
      tidewater::write_scenario(init_dir, tidewater::make_example_scenario(seed));
      if (!quiet) std::cout << "Example scenario written to " << init_dir << "\n";
      return 0;
    }

    tidewater::ParamOverrides overrides;
    for (const auto& kv : get_all_str_args(argc, argv, "--set")) {
      const auto eq = kv.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "--set expects NAME=VALUE (got '" << kv << "')\n\n";
        print_usage(argv[0]);
        return 2;
      }
      overrides[tidewater::trim_copy(kv.substr(0, eq))] = parse_cli_value(tidewater::trim_copy(kv.substr(eq + 1)));
    }

    tidewater::JsonDirectorySource source(data_dir);
    tidewater::ScenarioConfig cfg = source.load_scenario();

    if (!study_param.empty()) {
      const auto tokens = tidewater::split_trimmed(study_values, ',');
      if (tokens.empty()) {
        std::cerr << "--study requires --values V1,V2,...\n\n";
        print_usage(argv[0]);
        return 2;
      }
      std::vector<tidewater::json::Value> values;
      values.reserve(tokens.size());
      for (const auto& t : tokens) values.push_back(parse_cli_value(t));

      tidewater::apply_param_overrides(cfg.params, overrides);
      const auto runs =
          tidewater::run_parameter_study(cfg, study_param, values, no_save ? nullptr : &source);

      if (!quiet) {
        std::cout << "Parameter study: " << study_param << "\n";
        for (const auto& run : runs) {
          std::cout << "  " << tidewater::json::stringify(run.param_value, 0) << ": service "
                    << tidewater::format_number(run.metrics.overall_service_level * 100.0) << "%, stockouts "
                    << run.metrics.total_stockout_events << ", failed dispatches "
                    << run.metrics.total_failed_dispatches << "\n";
        }
      }
      if (!study_out.empty()) {
        tidewater::write_text_file(study_out, tidewater::json::stringify(tidewater::study_to_json(runs), 2) + "\n");
        if (!quiet) std::cout << "\nWrote study results to " << study_out << "\n";
      }
      return 0;
    }

    tidewater::Simulation sim(std::move(cfg), overrides);
    const tidewater::SimResults results = sim.run();

    if (!quiet) print_summary(results);

    if (!out_path.empty()) {
      tidewater::write_text_file(out_path, tidewater::json::stringify(tidewater::results_to_json(results), 2) + "\n");
      if (!quiet) std::cout << "\nWrote results to " << out_path << "\n";
    } else if (!no_save) {
      tidewater::publish_results(source, results);
    }

    if (has_flag(argc, argv, "--dump-events")) {
      std::cout << "\n--- Events ---\n" << tidewater::events_to_jsonl(results.events);
    }

    if (!export_events_csv_path.empty()) {
      try {
        tidewater::write_text_file(export_events_csv_path, tidewater::events_to_csv(results.events));
        if (!quiet) std::cout << "\nWrote events CSV to " << export_events_csv_path << "\n";
      } catch (const std::exception& e) {
        std::cerr << "Failed to export events CSV: " << e.what() << "\n";
        return 1;
      }
    }

    if (!export_events_jsonl_path.empty()) {
      try {
        tidewater::write_text_file(export_events_jsonl_path, tidewater::events_to_jsonl(results.events));
        if (!quiet) std::cout << "\nWrote events JSONL to " << export_events_jsonl_path << "\n";
      } catch (const std::exception& e) {
        std::cerr << "Failed to export events JSONL: " << e.what() << "\n";
        return 1;
      }
    }

    return 0;
  } catch (const std::exception& e) {
    tidewater::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
