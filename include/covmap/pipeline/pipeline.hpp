#pragma once

#include "covmap/config/configuration.hpp"
#include "covmap/core/events.hpp"
#include "covmap/core/types.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace covmap::pipeline {

struct PipelineResult {
  BoundingBox bounds;
  std::string engine_command;
  bool dry_run = false;
  std::optional<OverlayPackage> package;
  std::optional<fs::path> run_record;
};

// Checks the external tools a run depends on. Creates nothing.
// Throws EngineNotFound / PackagingFailed.
void preflight(const config::ResolvedConfig &cfg);

/**
 * Bounds -> Engine -> Raster -> Package for an already resolved config.
 *
 * stage_start / stage_end events go to `events`, tagged diagnostics to
 * `diag`. A failing stage gets a stage_end with status "error" and the
 * exception propagates. With `dry_run` only the bounds are computed and
 * the engine command line is reported; nothing is written.
 */
PipelineResult run_coverage_pipeline(const config::ResolvedConfig &cfg,
                                     const std::string &run_id,
                                     core::EventEmitter &emitter,
                                     std::ostream &events, std::ostream &diag,
                                     bool dry_run = false);

// <site>.run.json: parameters, bounds, engine command and output checksums.
fs::path write_run_record(const config::ResolvedConfig &cfg,
                          const PipelineResult &result,
                          const std::string &run_id);

void print_summary(const config::ResolvedConfig &cfg,
                   const PipelineResult &result, std::ostream &out);

} // namespace covmap::pipeline
