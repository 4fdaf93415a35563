#include "covmap/core/errors.hpp"
#include "covmap/core/events.hpp"
#include "covmap/core/utils.hpp"
#include "covmap/pipeline/pipeline.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <sstream>

using namespace covmap;
using covmap::testing::TempDir;
using covmap::testing::base_raw_config;
using covmap::testing::write_fake_engine;

namespace fs = std::filesystem;

namespace {

config::ResolvedConfig make_config(const fs::path &engine, const fs::path &sdf,
                                   const fs::path &out, bool kmz) {
  auto raw = base_raw_config(engine, sdf, out);
  raw["output.create_kmz"] = kmz ? "true" : "false";
  raw["output.keep_raster"] = "false";
  raw["output.write_manifest"] = "true";
  std::ostringstream diag;
  return config::resolve_config(raw, diag);
}

std::vector<nlohmann::json> parse_events(const std::string &text) {
  std::vector<nlohmann::json> events;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) events.push_back(nlohmann::json::parse(line));
  }
  return events;
}

} // namespace

TEST_CASE("pipeline_produces_overlay_package") {
  TempDir tmp("covmap_pipeline");
  const fs::path engine = write_fake_engine(tmp.path());
  const bool kmz = covmap::testing::has_tool("zip");
  const auto cfg = make_config(engine, tmp.path(), tmp.path() / "out", kmz);

  core::EventEmitter emitter;
  std::ostringstream events, diag;
  const auto result = pipeline::run_coverage_pipeline(cfg, "run-1", emitter, events, diag);

  REQUIRE(result.package.has_value());
  const OverlayPackage &pkg = *result.package;
  REQUIRE(fs::is_regular_file(pkg.image_path));
  REQUIRE(fs::is_regular_file(pkg.descriptor_path));
  REQUIRE(pkg.manifest_path.has_value());
  REQUIRE_FALSE(pkg.raster_path.has_value());
  REQUIRE_FALSE(fs::exists(tmp.path() / "out" / "TESTSITE.ppm"));
  REQUIRE(pkg.archive_path.has_value() == kmz);
  REQUIRE(result.run_record.has_value());
  REQUIRE(pkg.index_path == tmp.path() / "out" / "index.json");
  const auto index = nlohmann::json::parse(core::read_text(*pkg.index_path));
  REQUIRE(index["manifests"] == nlohmann::json::array({"TESTSITE.manifest.json"}));

  const auto record = nlohmann::json::parse(core::read_text(*result.run_record));
  REQUIRE(record["run_id"] == "run-1");
  REQUIRE(record["artifacts"].contains("TESTSITE.png"));
  REQUIRE(record["artifacts"]["TESTSITE.png"]["sha256"] == core::sha256_file(pkg.image_path));
  REQUIRE(record["engine_command"] == result.engine_command);

  const auto evs = parse_events(events.str());
  std::vector<std::string> sequence;
  for (const auto &e : evs) {
    REQUIRE(e["run_id"] == "run-1");
    sequence.push_back(e["type"].get<std::string>() + ":" + e["stage_name"].get<std::string>() +
                       ":" + (e.contains("status") ? e["status"].get<std::string>() : ""));
  }
  REQUIRE(sequence == std::vector<std::string>{
                          "stage_start:BOUNDS:", "stage_end:BOUNDS:ok",
                          "stage_start:ENGINE:", "stage_end:ENGINE:ok",
                          "stage_start:RASTER:", "stage_end:RASTER:ok",
                          "stage_start:PACKAGE:", "stage_end:PACKAGE:ok"});
}

TEST_CASE("pipeline_reruns_are_byte_identical") {
  TempDir tmp("covmap_pipeline");
  const fs::path engine = write_fake_engine(tmp.path());
  core::EventEmitter emitter;
  std::ostringstream events, diag;

  const auto a = pipeline::run_coverage_pipeline(
      make_config(engine, tmp.path(), tmp.path() / "a", false), "run-a", emitter, events, diag);
  const auto b = pipeline::run_coverage_pipeline(
      make_config(engine, tmp.path(), tmp.path() / "b", false), "run-b", emitter, events, diag);

  REQUIRE(core::read_bytes(a.package->image_path) == core::read_bytes(b.package->image_path));
  REQUIRE(core::read_text(a.package->descriptor_path) ==
          core::read_text(b.package->descriptor_path));
  REQUIRE(core::read_text(*a.package->manifest_path) == core::read_text(*b.package->manifest_path));

  // Same directory again: stale outputs are replaced, not appended to.
  const auto before = core::sha256_file(a.package->image_path);
  const auto again = pipeline::run_coverage_pipeline(
      make_config(engine, tmp.path(), tmp.path() / "a", false), "run-a2", emitter, events, diag);
  REQUIRE(core::sha256_file(again.package->image_path) == before);
  REQUIRE_FALSE(fs::exists(tmp.path() / "a" / "TESTSITE_transparent.png"));
}

TEST_CASE("pipeline_missing_engine_creates_no_outputs") {
  TempDir tmp("covmap_pipeline");
  const fs::path out = tmp.path() / "out";
  const auto cfg = make_config(tmp.path() / "no-such-engine", tmp.path(), out, false);

  core::EventEmitter emitter;
  std::ostringstream events, diag;
  REQUIRE_THROWS_AS(pipeline::run_coverage_pipeline(cfg, "run-x", emitter, events, diag),
                    EngineNotFound);
  REQUIRE_FALSE(fs::exists(out));

  const auto evs = parse_events(events.str());
  REQUIRE(evs.back()["type"] == "stage_end");
  REQUIRE(evs.back()["stage_name"] == "ENGINE");
  REQUIRE(evs.back()["status"] == "error");
}

TEST_CASE("pipeline_dry_run_writes_nothing") {
  TempDir tmp("covmap_pipeline");
  const fs::path out = tmp.path() / "out";
  const auto cfg = make_config(tmp.path() / "no-such-engine", tmp.path(), out, true);

  core::EventEmitter emitter;
  std::ostringstream events, diag;
  const auto result = pipeline::run_coverage_pipeline(cfg, "run-d", emitter, events, diag, true);

  REQUIRE(result.dry_run);
  REQUIRE_FALSE(result.package.has_value());
  REQUIRE_FALSE(fs::exists(out));
  REQUIRE(result.engine_command.find("'-o' '" + (out / "TESTSITE").string() + "'") !=
          std::string::npos);

  std::ostringstream summary;
  pipeline::print_summary(cfg, result, summary);
  REQUIRE(summary.str().find("RF Coverage Map Dry Run") != std::string::npos);
  REQUIRE(summary.str().find("ERP:            99.763116 W") != std::string::npos);
}

TEST_CASE("pipeline_output_dir_that_is_a_file_fails_in_engine_stage") {
  TempDir tmp("covmap_pipeline");
  const fs::path engine = write_fake_engine(tmp.path());
  const fs::path out = tmp.path() / "taken";
  core::write_text(out, "not a directory");
  const auto cfg = make_config(engine, tmp.path(), out, false);

  core::EventEmitter emitter;
  std::ostringstream events, diag;
  try {
    pipeline::run_coverage_pipeline(cfg, "run-f", emitter, events, diag);
    FAIL("expected EngineExecutionFailed");
  } catch (const EngineExecutionFailed &e) {
    REQUIRE(e.stage() == "ENGINE");
    REQUIRE(std::string(e.what()).find(out.string()) != std::string::npos);
  }
  REQUIRE(core::read_text(out) == "not a directory");

  const auto evs = parse_events(events.str());
  REQUIRE(evs.back()["stage_name"] == "ENGINE");
  REQUIRE(evs.back()["status"] == "error");
}

TEST_CASE("pipeline_run_record_failure_is_a_package_error") {
  TempDir tmp("covmap_pipeline");
  const fs::path engine = write_fake_engine(tmp.path());
  const fs::path out = tmp.path() / "out";
  fs::create_directories(out / "TESTSITE.run.json");
  const auto cfg = make_config(engine, tmp.path(), out, false);

  core::EventEmitter emitter;
  std::ostringstream events, diag;
  REQUIRE_THROWS_AS(pipeline::run_coverage_pipeline(cfg, "run-r", emitter, events, diag),
                    DescriptorWriteFailed);

  const auto evs = parse_events(events.str());
  REQUIRE(evs.back()["stage_name"] == "PACKAGE");
  REQUIRE(evs.back()["status"] == "error");
}
