#include "cli_shared.hpp"

#include "covmap/config/configuration.hpp"
#include "covmap/core/errors.hpp"
#include "covmap/core/events.hpp"
#include "covmap/core/types.hpp"
#include "covmap/core/utils.hpp"
#include "covmap/geo/bounds.hpp"
#include "covmap/pipeline/pipeline.hpp"

#include <CLI/CLI.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

namespace cli = covmap::cli;
namespace config = covmap::config;
namespace core = covmap::core;
namespace pipeline = covmap::pipeline;
using covmap::CovmapError;
using covmap::Stage;

config::RawConfig load_with_overrides(const std::string &config_path,
                                      const std::vector<std::string> &overrides) {
  config::RawConfig raw = config::load_raw_config(config_path);
  for (const auto &o : overrides) {
    config::apply_override(raw, o);
  }
  return raw;
}

int run_command(const std::string &config_path,
                const std::vector<std::string> &overrides, bool dry_run,
                const std::string &run_id_override) {
  std::string run_id = run_id_override;
  if (run_id.empty()) {
    try {
      run_id = core::get_run_id();
    } catch (const std::exception &e) {
      std::cerr << "[ERROR] " << e.what() << std::endl;
      return 1;
    }
  }
  core::EventEmitter emitter;

  // Events are held back until the optional log file is open.
  std::ostringstream pending;
  emitter.run_start(run_id, {{"config_path", config_path}, {"dry_run", dry_run}},
                    pending);

  config::ResolvedConfig cfg;
  try {
    emitter.stage_start(run_id, Stage::CONFIG, pending);
    cfg = config::resolve_config(load_with_overrides(config_path, overrides),
                                 std::cerr);
    emitter.stage_end(run_id, Stage::CONFIG, "ok",
                      {{"site", cfg.site.name},
                       {"erp_watts", cfg.site.erp_watts},
                       {"resolution", cfg.profile.resolution},
                       {"profile", cfg.profile.label}},
                      pending);
  } catch (const CovmapError &e) {
    emitter.stage_end(run_id, Stage::CONFIG, "error", {{"error", e.what()}},
                      pending);
    std::cout << pending.str();
    return cli::report_failure(emitter, run_id, e, std::cout);
  }

  std::ofstream event_log_file;
  std::unique_ptr<cli::TeeBuf> tee_buf;
  std::string log_warning;
  if (cfg.output.write_event_log && !dry_run) {
    // Missing tools must not leave a log directory behind.
    try {
      pipeline::preflight(cfg);
    } catch (const CovmapError &e) {
      std::cout << pending.str();
      return cli::report_failure(emitter, run_id, e, std::cout);
    }
    const fs::path log_dir = cfg.paths.output_dir / "logs";
    const fs::path log_path = log_dir / (cfg.site.name + "_events.jsonl");
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (!ec) {
      event_log_file.open(log_path, std::ios::out | std::ios::app);
    }
    if (!event_log_file) {
      log_warning = "cannot open event log " + log_path.string();
      std::cerr << "[CONFIG] Warning: " << log_warning << std::endl;
    } else {
      tee_buf = std::make_unique<cli::TeeBuf>(std::vector<std::streambuf *>{
          std::cout.rdbuf(), event_log_file.rdbuf()});
    }
  }
  std::ostream log_file(tee_buf ? static_cast<std::streambuf *>(tee_buf.get())
                                : std::cout.rdbuf());
  log_file << pending.str();
  log_file.flush();
  if (!log_warning.empty()) {
    emitter.warning(run_id, log_warning, log_file);
  }

  pipeline::PipelineResult result;
  try {
    result = pipeline::run_coverage_pipeline(cfg, run_id, emitter, log_file,
                                             std::cerr, dry_run);
  } catch (const CovmapError &e) {
    return cli::report_failure(emitter, run_id, e, log_file);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    emitter.run_end(run_id, false, "error", {{"error", e.what()}}, log_file);
    return 1;
  }

  emitter.run_end(run_id, true, dry_run ? "dry_run" : "ok",
                  {{"site", cfg.site.name}}, log_file);
  pipeline::print_summary(cfg, result, std::cout);
  return 0;
}

int validate_command(const std::string &config_path,
                     const std::vector<std::string> &overrides) {
  try {
    config::ResolvedConfig cfg = config::resolve_config(
        load_with_overrides(config_path, overrides), std::cerr);
    YAML::Emitter out;
    out << config::to_yaml(cfg);
    std::cout << out.c_str() << std::endl;
    std::cerr << "[CONFIG] OK: " << cfg.site.name << ", ERP "
              << core::format_number(cfg.site.erp_watts) << " W, "
              << cfg.profile.label << std::endl;
    return 0;
  } catch (const CovmapError &e) {
    std::cerr << "[ERROR] " << e.stage() << ": " << e.what() << std::endl;
    return 1;
  }
}

int bounds_command(double lat, double lon, double radius, bool imperial) {
  const auto units =
      imperial ? covmap::UnitSystem::IMPERIAL : covmap::UnitSystem::METRIC;
  const covmap::BoundingBox b = covmap::geo::compute_bounds(lat, lon, radius, units);
  core::json out = {{"north", b.north},
                    {"south", b.south},
                    {"east", b.east},
                    {"west", b.west}};
  std::cout << out.dump(2) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"covmap - RF coverage map generator (Signal-Server)"};
  app.require_subcommand(1);

  std::string config_path;
  std::vector<std::string> overrides;
  std::string run_id;
  bool dry_run = false;

  auto run_cmd = app.add_subcommand("run", "Generate the coverage overlay");
  run_cmd->add_option("--config", config_path, "Path to site YAML")
      ->required()
      ->check(CLI::ExistingFile);
  run_cmd->add_option("--set", overrides, "Override a parameter (section.key=value)");
  run_cmd->add_flag("--dry-run", dry_run,
                    "Resolve config and print the engine command only");
  run_cmd->add_option("--run-id", run_id, "Use this run id instead of a generated one");

  auto validate_cmd =
      app.add_subcommand("validate", "Resolve a config and print it as YAML");
  validate_cmd->add_option("--config", config_path, "Path to site YAML")
      ->required()
      ->check(CLI::ExistingFile);
  validate_cmd->add_option("--set", overrides,
                           "Override a parameter (section.key=value)");

  double lat = 0.0;
  double lon = 0.0;
  double radius = 0.0;
  bool imperial = false;
  auto bounds_cmd =
      app.add_subcommand("bounds", "Print the bounding box for a center and radius");
  bounds_cmd->add_option("--lat", lat, "Latitude (decimal degrees)")->required();
  bounds_cmd->add_option("--lon", lon, "Longitude (decimal degrees)")->required();
  bounds_cmd->add_option("--radius", radius, "Radius (km, or miles with --imperial)")
      ->required();
  bounds_cmd->add_flag("--imperial", imperial, "Radius is in miles");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(config_path, overrides, dry_run, run_id);
  }
  if (validate_cmd->parsed()) {
    return validate_command(config_path, overrides);
  }
  if (bounds_cmd->parsed()) {
    return bounds_command(lat, lon, radius, imperial);
  }
  return 1;
}
