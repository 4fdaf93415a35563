#include "covmap/config/configuration.hpp"
#include "covmap/core/errors.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <sstream>

using Catch::Approx;
using namespace covmap;
using covmap::testing::base_raw_config;

namespace {

config::RawConfig sample() {
  return base_raw_config("/opt/signalserver/signalserver", "/data/sdf", "/tmp/covmap-out");
}

config::ResolvedConfig resolve(const config::RawConfig &raw) {
  std::ostringstream diag;
  return config::resolve_config(raw, diag);
}

} // namespace

TEST_CASE("resolver_computes_erp_from_power_and_gain") {
  const auto cfg = resolve(sample());
  REQUIRE(cfg.site.erp_watts == Approx(50.0 * std::pow(10.0, 0.3)).margin(0.01));
  REQUIRE(cfg.site.erp_watts == Approx(99.763).margin(0.01));

  for (double p : {0.5, 5.0, 1000.0}) {
    for (double g : {-3.0, 0.0, 2.15, 12.0}) {
      REQUIRE(config::compute_erp(p, g) ==
              Approx(p * std::pow(10.0, g / 10.0)).margin(0.01));
    }
  }
}

TEST_CASE("resolver_applies_defaults") {
  const auto cfg = resolve(sample());
  REQUIRE(cfg.site.name == "TESTSITE");
  REQUIRE(cfg.site.model == PropagationModel::ITM);
  REQUIRE(cfg.site.units == UnitSystem::METRIC);
  REQUIRE(cfg.site.output_unit == OutputUnit::POWER_DBM);
  REQUIRE(cfg.site.keep_raster);
  REQUIRE_FALSE(cfg.site.reliability.has_value());
  REQUIRE_FALSE(cfg.site.rx_gain.has_value());
  REQUIRE(cfg.output.create_kmz);
  REQUIRE_FALSE(cfg.output.write_manifest);
  REQUIRE(cfg.paths.zip_bin == "zip");
}

TEST_CASE("resolver_normalizes_unicode_minus") {
  auto raw = sample();
  raw["transmitter.lon"] = "\xE2\x88\x92" "76.883611";
  raw["receiver.threshold"] = "\xE2\x88\x92" "90";
  const auto cfg = resolve(raw);
  REQUIRE(cfg.site.tx_lon == Approx(-76.883611));
  REQUIRE(cfg.site.rx_threshold == Approx(-90.0));
}

TEST_CASE("resolver_treats_empty_values_as_unset") {
  auto raw = sample();
  raw["model.reliability"] = "";
  raw["terrain.code"] = "  ";
  raw["antenna.pattern"] = "";
  const auto cfg = resolve(raw);
  REQUIRE_FALSE(cfg.site.reliability.has_value());
  REQUIRE_FALSE(cfg.site.terrain_code.has_value());
  REQUIRE_FALSE(cfg.site.antenna_pattern.has_value());
}

TEST_CASE("resolver_rejects_invalid_values") {
  const std::vector<std::pair<std::string, std::string>> bad = {
      {"site.name", ""},
      {"site.name", "my site"},
      {"site.name", "a/b"},
      {"site.name", ".."},
      {"transmitter.lat", "95"},
      {"transmitter.lat", "75.5"},
      {"transmitter.lat", "-70.0001"},
      {"transmitter.lon", "181"},
      {"transmitter.lat", "forty"},
      {"transmitter.frequency_mhz", "19.9"},
      {"transmitter.frequency_mhz", "100001"},
      {"transmitter.power_watts", "0"},
      {"coverage.radius", "0"},
      {"coverage.radius", "-5"},
      {"coverage.resolution", "900"},
      {"coverage.resolution", "1200.5"},
      {"model.propagation_model", "13"},
      {"model.propagation_mode", "4"},
      {"model.reliability", "100"},
      {"model.confidence", "0"},
      {"terrain.code", "7"},
      {"terrain.dielectric", "1"},
      {"terrain.conductivity", "0.5"},
      {"terrain.climate_code", "8"},
      {"terrain.ground_clutter", "-1"},
      {"antenna.rotation", "360"},
      {"antenna.downtilt", "-11"},
      {"antenna.downtilt_direction", "400"},
      {"output.metric", "maybe"},
      {"paths.output_dir", ""},
  };
  for (const auto &[key, value] : bad) {
    auto raw = sample();
    raw[key] = value;
    INFO(key << "=" << value);
    REQUIRE_THROWS_AS(resolve(raw), ConfigError);
  }
}

TEST_CASE("resolver_rejects_unknown_keys") {
  auto raw = sample();
  raw["transmitter.colour"] = "red";
  REQUIRE_THROWS_AS(resolve(raw), ConfigError);

  auto raw2 = sample();
  REQUIRE_THROWS_AS(config::apply_override(raw2, "coverage.radiuz=10"), ConfigError);
  REQUIRE_THROWS_AS(config::apply_override(raw2, "no_equals_sign"), ConfigError);
}

TEST_CASE("resolver_accepts_latitude_at_envelope_edge") {
  auto raw = sample();
  raw["transmitter.lat"] = "70";
  REQUIRE_NOTHROW(resolve(raw));
  raw["transmitter.lat"] = "-70";
  REQUIRE_NOTHROW(resolve(raw));
}

TEST_CASE("resolution_profile_selection") {
  config::ToolPaths paths;
  paths.engine_bin = "/opt/ss/signalserver";
  paths.engine_hd_bin = "/opt/ss/signalserverHD";
  paths.sdf_dir_90m = "/data/sdf90";
  paths.sdf_dir_30m = "/data/sdf30";

  for (int res : {300, 600, 1200}) {
    const auto p = config::select_resolution_profile(res, paths);
    REQUIRE_FALSE(p.high_definition);
    REQUIRE(p.engine_bin == paths.engine_bin);
    REQUIRE(p.terrain_dir == paths.sdf_dir_90m);
    REQUIRE(p.resolution == res);
  }
  const auto hd = config::select_resolution_profile(3600, paths);
  REQUIRE(hd.high_definition);
  REQUIRE(hd.engine_bin == paths.engine_hd_bin);
  REQUIRE(hd.terrain_dir == paths.sdf_dir_30m);
  REQUIRE(hd.label == "HD 30m");
}

TEST_CASE("resolver_reports_selected_profile") {
  auto raw = sample();
  raw["coverage.resolution"] = "3600";
  std::ostringstream diag;
  const auto cfg = config::resolve_config(raw, diag);
  REQUIRE(cfg.profile.high_definition);
  REQUIRE(diag.str().find("[CONFIG] Using HD binary") != std::string::npos);
  REQUIRE(diag.str().find("/data/sdf") != std::string::npos);
}

TEST_CASE("overrides_replace_file_values") {
  auto raw = sample();
  config::apply_override(raw, "coverage.radius = 25");
  config::apply_override(raw, "output.create_kmz=false");
  const auto cfg = resolve(raw);
  REQUIRE(cfg.site.radius == Approx(25.0));
  REQUIRE_FALSE(cfg.output.create_kmz);
}

TEST_CASE("yaml_sections_are_flattened") {
  const YAML::Node node = YAML::Load(R"(
site:
  name: HILLTOP
transmitter:
  lat: 40.5
  antenna_gain_dbi: ~
coverage:
  resolution: 600
)");
  const auto raw = config::raw_config_from_yaml(node);
  REQUIRE(raw.at("site.name") == "HILLTOP");
  REQUIRE(raw.at("transmitter.lat") == "40.5");
  REQUIRE(raw.at("transmitter.antenna_gain_dbi").empty());
  REQUIRE(raw.at("coverage.resolution") == "600");

  const auto sparse = config::raw_config_from_yaml(YAML::Load(R"(
site:
  name: HILLTOP
terrain:
  # every key left at its default
antenna:
)"));
  REQUIRE(sparse.at("site.name") == "HILLTOP");
  REQUIRE(sparse.size() == 1);

  REQUIRE_THROWS_AS(config::raw_config_from_yaml(YAML::Load("site:\n  nam: X\n")),
                    ConfigError);
  REQUIRE_THROWS_AS(config::raw_config_from_yaml(YAML::Load("site: 3\n")), ConfigError);
}

TEST_CASE("resolved_config_round_trips_through_yaml") {
  auto raw = sample();
  raw["model.reliability"] = "50";
  raw["antenna.downtilt"] = "\xE2\x88\x92" "2.5";
  const auto cfg = resolve(raw);

  const auto again = resolve(config::raw_config_from_yaml(config::to_yaml(cfg)));
  REQUIRE(again.site.tx_lat == Approx(cfg.site.tx_lat));
  REQUIRE(again.site.erp_watts == Approx(cfg.site.erp_watts));
  REQUIRE(again.site.reliability == cfg.site.reliability);
  REQUIRE(again.site.antenna_downtilt.value() == Approx(-2.5));
  REQUIRE_FALSE(again.site.confidence.has_value());
  REQUIRE(again.paths.output_dir == cfg.paths.output_dir);
}
