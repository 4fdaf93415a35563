#pragma once

#include "covmap/core/types.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace covmap::config {

namespace fs = std::filesystem;

// Flat set of named values ("transmitter.lat" -> "41.203586").
// An empty value means the parameter is unset.
using RawConfig = std::map<std::string, std::string>;

struct ToolPaths {
  fs::path engine_bin;     // standard Signal-Server (300/600/1200)
  fs::path engine_hd_bin;  // Signal-Server HD (3600)
  fs::path sdf_dir_90m;    // SRTM3 .sdf tiles
  fs::path sdf_dir_30m;    // SRTM1 -hd.sdf tiles
  fs::path output_dir;
  std::optional<fs::path> color_file; // .dcf/.scf palette
  std::string zip_bin = "zip";
};

struct OutputOptions {
  bool create_kmz = true;
  bool write_manifest = false;
  bool write_event_log = false;
  std::string manifest_image_prefix; // prepended to the image name in the manifest
};

struct ResolvedConfig {
  SiteParameters site;
  ResolutionProfile profile;
  ToolPaths paths;
  OutputOptions output;
};

// Every key the resolver understands, in canonical order.
const std::vector<std::string> &known_keys();

RawConfig load_raw_config(const fs::path &path);
RawConfig raw_config_from_yaml(const YAML::Node &node);

// Applies a "section.key=value" assignment.
void apply_override(RawConfig &raw, const std::string &assignment);

// Validates and normalizes a raw configuration. Throws ConfigError.
// The selected resolution profile is reported on `diag`.
ResolvedConfig resolve_config(const RawConfig &raw, std::ostream &diag);

ResolutionProfile select_resolution_profile(int resolution, const ToolPaths &paths);

// ERP in watts from transmitter power and antenna gain.
double compute_erp(double power_watts, double gain_dbi);

// Replaces U+2212 and other dash look-alikes with an ASCII '-'.
std::string normalize_minus(const std::string &value);

YAML::Node to_yaml(const ResolvedConfig &cfg);

} // namespace covmap::config
