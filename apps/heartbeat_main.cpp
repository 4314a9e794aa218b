#include "quantum_surface/config/configuration.hpp"
#include "quantum_surface/core/errors.hpp"
#include "quantum_surface/core/events.hpp"
#include "quantum_surface/core/types.hpp"
#include "quantum_surface/core/utils.hpp"
#include "quantum_surface/io/preview.hpp"
#include "quantum_surface/io/run_record.hpp"
#include "quantum_surface/io/surface_document.hpp"
#include "quantum_surface/ledger/budget_ledger.hpp"
#include "quantum_surface/scheduler/scheduler.hpp"
#include "quantum_surface/scheduler/simulated_backend.hpp"
#include "quantum_surface/service/surface_service.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

namespace fs = std::filesystem;

namespace {

namespace qs = quantum_surface;
namespace config = quantum_surface::config;
namespace core = quantum_surface::core;
namespace io = quantum_surface::io;
namespace scheduler = quantum_surface::scheduler;

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop.store(true); }

config::Config load_config(const std::string &path) {
  config::Config cfg = path.empty() ? config::Config{} : config::Config::load(path);
  cfg.validate();
  return cfg;
}

std::vector<std::shared_ptr<scheduler::ExecutionBackend>>
make_backends(const config::Config &cfg, std::uint64_t seed) {
  std::vector<std::string> names = cfg.scheduler.backend_rotation;
  if (names.empty()) {
    names.push_back("aer_simulator");
  }

  std::vector<std::shared_ptr<scheduler::ExecutionBackend>> backends;
  std::uint64_t index = 0;
  for (const auto &name : names) {
    scheduler::SimulatedBackendOptions opts;
    opts.name = core::ends_with(name, "_simulator") ? name : name + "_simulator";
    opts.seed = seed + index++;
    opts.billed_seconds = cfg.scheduler.estimated_seconds_per_beat;
    backends.push_back(std::make_shared<scheduler::SimulatedBackend>(opts));
  }
  return backends;
}

void export_surface(qs::service::SurfaceService &service, const fs::path &surface_path,
                    const fs::path &preview_path) {
  auto mesh = service.current_mesh();
  core::write_text(surface_path, service.surface_document().dump(2));
  if (mesh && !preview_path.empty()) {
    io::write_preview_png(*mesh, preview_path);
  }
}

int run_command(const std::string &config_path, int max_beats, std::uint64_t seed,
                const std::string &results_override, bool fast) {
  config::Config cfg;
  try {
    cfg = load_config(config_path);
  } catch (const qs::QuantumSurfaceError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  if (!results_override.empty()) {
    cfg.output.results_dir = results_override;
  }

  const fs::path results_dir(cfg.output.results_dir);
  const fs::path records_dir = results_dir / "runs";
  std::error_code ec;
  fs::create_directories(records_dir, ec);
  if (ec) {
    std::cerr << "Error: cannot create " << records_dir << ": " << ec.message() << std::endl;
    return 1;
  }

  std::ofstream event_log(results_dir / cfg.output.events_file, std::ios::app);
  if (!event_log) {
    std::cerr << "Error: cannot open event log in " << results_dir << std::endl;
    return 1;
  }

  const std::string run_id = core::get_run_id();
  core::EventEmitter events(std::cout, &event_log);

  const fs::path config_snapshot = results_dir / "config.yaml";
  std::string config_hash;
  try {
    cfg.save(config_snapshot);
    config_hash = core::sha256_file(config_snapshot);
  } catch (const qs::QuantumSurfaceError &e) {
    events.error(run_id, e.what());
    return 1;
  }

  // Virtual clock: sleeps only advance time, beats follow each other directly
  qs::TimePoint virtual_now = qs::Clock::now();
  scheduler::SleepFn sleep = scheduler::sleep_seconds;
  if (fast) {
    sleep = [](double) {};
  }

  qs::ledger::BudgetLedger ledger(cfg.budget, fast ? virtual_now : qs::Clock::now());
  std::unique_ptr<scheduler::Scheduler> sched;
  try {
    sched = std::make_unique<scheduler::Scheduler>(cfg, ledger, make_backends(cfg, seed), events,
                                                   run_id, sleep);
  } catch (const qs::ConfigError &e) {
    events.error(run_id, e.what());
    return 1;
  }

  sched->set_stop_flag(&g_stop);

  qs::service::SurfaceService service(cfg, &events, run_id);

  events.scheduler_start(run_id,
                         {{"interval_seconds", cfg.scheduler.interval_seconds},
                          {"period_quota_seconds", cfg.budget.period_quota_seconds},
                          {"period_days", cfg.budget.period_days},
                          {"max_beats", max_beats},
                          {"seed", seed},
                          {"fast", fast},
                          {"config_hash", config_hash},
                          {"results_dir", results_dir.string()}});

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  const fs::path surface_path = results_dir / cfg.output.surface_file;
  const fs::path preview_path =
      cfg.output.write_preview ? results_dir / cfg.output.preview_file : fs::path();

  int due_ticks = 0;
  int exit_code = 0;
  while (!g_stop.load() && (max_beats <= 0 || due_ticks < max_beats)) {
    const qs::TimePoint now = fast ? virtual_now : qs::Clock::now();
    scheduler::TickOutcome outcome;
    try {
      outcome = sched->tick(now);
    } catch (const std::exception &e) {
      events.error(run_id, std::string("scheduler tick failed: ") + e.what());
      exit_code = 1;
      break;
    }

    if (outcome.status == scheduler::TickStatus::NOT_DUE ||
        outcome.status == scheduler::TickStatus::BUSY) {
      if (fast) {
        virtual_now = outcome.next_check;
      } else {
        // Wake at least once a second so a stop request is seen promptly
        const double wait = std::chrono::duration<double>(outcome.next_check - now).count();
        scheduler::sleep_seconds(std::min(std::max(wait, 0.0), 1.0));
      }
      continue;
    }

    ++due_ticks;
    if (outcome.status == scheduler::TickStatus::SUCCEEDED && outcome.record) {
      try {
        io::save_run_record(*outcome.record, records_dir);
        service.ingest(*outcome.record);
        export_surface(service, surface_path, preview_path);
      } catch (const qs::QuantumSurfaceError &e) {
        events.error(run_id, e.what());
        exit_code = 1;
        break;
      }
    } else if (outcome.status == scheduler::TickStatus::CANCELLED) {
      break;
    }

    if (fast) {
      virtual_now = outcome.next_check;
    }
  }

  if (g_stop.load()) {
    events.warning(run_id, "stop requested; scheduler exiting");
  }

  const auto state = ledger.state(fast ? virtual_now : qs::Clock::now());
  events.emit({{"type", "scheduler_end"},
               {"run_id", run_id},
               {"ts", core::get_iso_timestamp()},
               {"beats_completed", sched->beats_completed()},
               {"budget_consumed_seconds", state.consumed_seconds},
               {"budget_remaining_seconds", state.remaining_seconds()}});
  return exit_code;
}

int surface_command(const std::string &config_path, const std::string &records_dir,
                    const std::string &out_path, const std::string &preview_path) {
  try {
    const config::Config cfg = load_config(config_path);
    const std::string run_id = core::get_run_id();
    core::EventEmitter events(std::cout);

    const auto records = io::load_run_records(records_dir);
    qs::service::SurfaceService service(cfg, &events, run_id);
    for (const auto &rec : records) {
      service.ingest(rec);
    }
    if (records.empty()) {
      events.warning(run_id, "no run records found in " + records_dir);
    }

    const fs::path out = out_path.empty()
                             ? fs::path(cfg.output.results_dir) / cfg.output.surface_file
                             : fs::path(out_path);
    export_surface(service, out, preview_path);

    if (auto mesh = service.current_mesh()) {
      fs::path mesh_path = out;
      mesh_path.replace_extension(".mesh.json");
      core::write_text(mesh_path, io::mesh_to_json(*mesh).dump());
    }
    std::cout << "Wrote " << out.string() << " (" << service.vertices().size() << " vertices, "
              << records.size() << " runs)" << std::endl;
    return 0;
  } catch (const qs::QuantumSurfaceError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

int validate_config_command(const std::string &config_path) {
  try {
    const config::Config cfg = load_config(config_path);
    std::cout << "Config OK: " << config_path << std::endl;
    std::cout << "  placement: " << config::placement_strategy_name(cfg.topology.strategy)
              << ", hue: " << config::hue_strategy_name(cfg.color.strategy)
              << ", glow: " << config::glow_pattern_name(cfg.modulation.glow) << std::endl;
    return 0;
  } catch (const qs::QuantumSurfaceError &e) {
    std::cerr << "Invalid config: " << e.what() << std::endl;
    return 1;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Quantum heartbeat scheduler and surface builder"};
  app.require_subcommand(1);

  std::string config_path;
  std::string results_dir;
  std::string records_dir;
  std::string out_path;
  std::string preview_path;
  int max_beats = 0;
  std::uint64_t seed = 42;
  bool fast = false;

  auto run_cmd = app.add_subcommand("run", "Run the heartbeat scheduler");
  run_cmd->add_option("--config", config_path, "Path to config.yaml");
  run_cmd->add_option("--max-beats", max_beats, "Stop after N due beats (0 = run until stopped)");
  run_cmd->add_option("--seed", seed, "Simulated backend seed");
  run_cmd->add_option("--results-dir", results_dir, "Override output.results_dir");
  run_cmd->add_flag("--fast", fast, "Virtual clock: run beats back to back");

  auto surface_cmd = app.add_subcommand("surface", "Rebuild the surface from stored run records");
  surface_cmd->add_option("--config", config_path, "Path to config.yaml");
  surface_cmd->add_option("--records", records_dir, "Directory of beat_*.json records")->required();
  surface_cmd->add_option("--out", out_path, "Surface document path");
  surface_cmd->add_option("--preview", preview_path, "Write a PNG preview of the mesh");

  auto validate_cmd = app.add_subcommand("validate-config", "Validate a config file");
  validate_cmd->add_option("--config", config_path, "Path to config.yaml")->required();

  auto schema_cmd = app.add_subcommand("schema", "Print the config JSON schema");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(config_path, max_beats, seed, results_dir, fast);
  }
  if (surface_cmd->parsed()) {
    return surface_command(config_path, records_dir, out_path, preview_path);
  }
  if (validate_cmd->parsed()) {
    return validate_config_command(config_path);
  }
  if (schema_cmd->parsed()) {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
  }
  return 1;
}
