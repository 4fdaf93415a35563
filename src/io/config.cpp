#include "covmap/config/configuration.hpp"
#include "covmap/core/errors.hpp"
#include "covmap/core/utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace covmap::config {

const std::vector<std::string>& known_keys() {
    static const std::vector<std::string> keys = {
        "site.name",
        "site.description",

        "paths.engine_bin",
        "paths.engine_hd_bin",
        "paths.sdf_dir_90m",
        "paths.sdf_dir_30m",
        "paths.output_dir",
        "paths.color_file",
        "paths.zip_bin",

        "transmitter.lat",
        "transmitter.lon",
        "transmitter.height",
        "transmitter.frequency_mhz",
        "transmitter.power_watts",
        "transmitter.antenna_gain_dbi",

        "receiver.height",
        "receiver.threshold",
        "receiver.gain",

        "coverage.radius",
        "coverage.resolution",

        "model.propagation_model",
        "model.propagation_mode",
        "model.reliability",
        "model.confidence",

        "terrain.code",
        "terrain.dielectric",
        "terrain.conductivity",
        "terrain.climate_code",
        "terrain.ground_clutter",

        "antenna.pattern",
        "antenna.rotation",
        "antenna.downtilt",
        "antenna.downtilt_direction",
        "antenna.horizontal_polarization",

        "output.metric",
        "output.dbm",
        "output.knife_edge_diffraction",
        "output.terrain_background",
        "output.create_kmz",
        "output.keep_raster",
        "output.debug",
        "output.write_manifest",
        "output.write_event_log",
        "output.manifest_image_prefix",
    };
    return keys;
}

static bool is_known_key(const std::string& key) {
    const auto& keys = known_keys();
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

static std::string scalar_text(const YAML::Node& n, const std::string& key) {
    if (!n || n.IsNull()) {
        return "";
    }
    if (!n.IsScalar()) {
        throw ConfigError("'" + key + "' must be a scalar value");
    }
    return core::trim(n.as<std::string>());
}

RawConfig load_raw_config(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return raw_config_from_yaml(node);
}

RawConfig raw_config_from_yaml(const YAML::Node& node) {
    RawConfig raw;
    if (!node || node.IsNull()) {
        return raw;
    }
    if (!node.IsMap()) {
        throw ConfigError("top level must be a mapping of sections");
    }

    for (const auto& section : node) {
        const std::string section_name = section.first.as<std::string>();
        if (section.second.IsNull()) {
            continue;
        }
        if (!section.second.IsMap()) {
            throw ConfigError("section '" + section_name + "' must be a mapping");
        }
        for (const auto& entry : section.second) {
            const std::string key = section_name + "." + entry.first.as<std::string>();
            if (!is_known_key(key)) {
                throw ConfigError("unknown parameter '" + key + "'");
            }
            raw[key] = scalar_text(entry.second, key);
        }
    }
    return raw;
}

void apply_override(RawConfig& raw, const std::string& assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw ConfigError("override must look like section.key=value: '" + assignment + "'");
    }
    const std::string key = core::trim(assignment.substr(0, eq));
    if (!is_known_key(key)) {
        throw ConfigError("unknown parameter '" + key + "'");
    }
    raw[key] = core::trim(assignment.substr(eq + 1));
}

static void put_optional(YAML::Node node, const std::optional<double>& v) {
    if (v) node = *v;
}

static void put_optional(YAML::Node node, const std::optional<int>& v) {
    if (v) node = *v;
}

YAML::Node to_yaml(const ResolvedConfig& cfg) {
    YAML::Node node;
    const SiteParameters& s = cfg.site;

    node["site"]["name"] = s.name;
    node["site"]["description"] = s.description;

    node["paths"]["engine_bin"] = cfg.paths.engine_bin.string();
    node["paths"]["engine_hd_bin"] = cfg.paths.engine_hd_bin.string();
    node["paths"]["sdf_dir_90m"] = cfg.paths.sdf_dir_90m.string();
    node["paths"]["sdf_dir_30m"] = cfg.paths.sdf_dir_30m.string();
    node["paths"]["output_dir"] = cfg.paths.output_dir.string();
    if (cfg.paths.color_file) node["paths"]["color_file"] = cfg.paths.color_file->string();
    node["paths"]["zip_bin"] = cfg.paths.zip_bin;

    node["transmitter"]["lat"] = s.tx_lat;
    node["transmitter"]["lon"] = s.tx_lon;
    node["transmitter"]["height"] = s.tx_height;
    node["transmitter"]["frequency_mhz"] = s.frequency_mhz;
    node["transmitter"]["power_watts"] = s.power_watts;
    node["transmitter"]["antenna_gain_dbi"] = s.antenna_gain_dbi;

    node["receiver"]["height"] = s.rx_height;
    node["receiver"]["threshold"] = s.rx_threshold;
    put_optional(node["receiver"]["gain"], s.rx_gain);

    node["coverage"]["radius"] = s.radius;
    node["coverage"]["resolution"] = s.resolution;

    node["model"]["propagation_model"] = propagation_model_to_int(s.model);
    put_optional(node["model"]["propagation_mode"], s.model_mode);
    put_optional(node["model"]["reliability"], s.reliability);
    put_optional(node["model"]["confidence"], s.confidence);

    put_optional(node["terrain"]["code"], s.terrain_code);
    put_optional(node["terrain"]["dielectric"], s.terrain_dielectric);
    put_optional(node["terrain"]["conductivity"], s.terrain_conductivity);
    put_optional(node["terrain"]["climate_code"], s.climate_code);
    put_optional(node["terrain"]["ground_clutter"], s.ground_clutter);

    if (s.antenna_pattern) node["antenna"]["pattern"] = *s.antenna_pattern;
    put_optional(node["antenna"]["rotation"], s.antenna_rotation);
    put_optional(node["antenna"]["downtilt"], s.antenna_downtilt);
    put_optional(node["antenna"]["downtilt_direction"], s.antenna_downtilt_direction);
    node["antenna"]["horizontal_polarization"] = s.horizontal_polarization;

    node["output"]["metric"] = s.units == UnitSystem::METRIC;
    node["output"]["dbm"] = s.output_unit == OutputUnit::POWER_DBM;
    node["output"]["knife_edge_diffraction"] = s.knife_edge_diffraction;
    node["output"]["terrain_background"] = s.terrain_background;
    node["output"]["create_kmz"] = cfg.output.create_kmz;
    node["output"]["keep_raster"] = s.keep_raster;
    node["output"]["debug"] = s.debug;
    node["output"]["write_manifest"] = cfg.output.write_manifest;
    node["output"]["write_event_log"] = cfg.output.write_event_log;
    node["output"]["manifest_image_prefix"] = cfg.output.manifest_image_prefix;

    return node;
}

} // namespace covmap::config
