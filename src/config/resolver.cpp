#include "covmap/config/configuration.hpp"
#include "covmap/core/errors.hpp"
#include "covmap/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <regex>

namespace covmap::config {

namespace {

constexpr double kMaxPolicyLatitude = 70.0;
constexpr double kMinFrequencyMhz = 20.0;
constexpr double kMaxFrequencyMhz = 100000.0;

// Reads typed values out of a RawConfig, treating empty strings as unset.
class RawReader {
public:
    explicit RawReader(const RawConfig& raw) : raw_(raw) {}

    std::optional<std::string> text(const std::string& key) const {
        auto it = raw_.find(key);
        if (it == raw_.end()) return std::nullopt;
        std::string v = core::trim(it->second);
        if (v.empty()) return std::nullopt;
        return v;
    }

    std::string required_text(const std::string& key) const {
        auto v = text(key);
        if (!v) throw ConfigError(key + " is required");
        return *v;
    }

    std::optional<double> number(const std::string& key) const {
        auto v = text(key);
        if (!v) return std::nullopt;
        const std::string s = normalize_minus(*v);
        size_t used = 0;
        double out = 0.0;
        try {
            out = std::stod(s, &used);
        } catch (const std::exception&) {
            throw ConfigError(key + " must be a number, got '" + *v + "'");
        }
        if (used != s.size() || !std::isfinite(out)) {
            throw ConfigError(key + " must be a number, got '" + *v + "'");
        }
        return out;
    }

    double required_number(const std::string& key) const {
        auto v = number(key);
        if (!v) throw ConfigError(key + " is required");
        return *v;
    }

    std::optional<int> integer(const std::string& key) const {
        auto v = text(key);
        if (!v) return std::nullopt;
        const std::string s = normalize_minus(*v);
        size_t used = 0;
        long out = 0;
        try {
            out = std::stol(s, &used);
        } catch (const std::exception&) {
            throw ConfigError(key + " must be an integer, got '" + *v + "'");
        }
        if (used != s.size() || out < std::numeric_limits<int>::min() ||
            out > std::numeric_limits<int>::max()) {
            throw ConfigError(key + " must be an integer, got '" + *v + "'");
        }
        return static_cast<int>(out);
    }

    bool boolean(const std::string& key, bool fallback) const {
        auto v = text(key);
        if (!v) return fallback;
        const std::string s = core::to_lower(*v);
        if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
        if (s == "false" || s == "no" || s == "off" || s == "0") return false;
        throw ConfigError(key + " must be true or false, got '" + *v + "'");
    }

private:
    const RawConfig& raw_;
};

template <typename T>
void check_range(const std::string& key, const std::optional<T>& v, T lo, T hi) {
    if (v && (*v < lo || *v > hi)) {
        throw ConfigError(key + " must be in [" + core::format_number(lo) + "," +
                          core::format_number(hi) + "], got " +
                          core::format_number(*v));
    }
}

void validate_site_name(const std::string& name) {
    static const std::regex allowed("^[A-Za-z0-9_.-]+$");
    if (name.empty()) {
        throw ConfigError("site.name must not be empty");
    }
    if (name == "." || name == ".." || !std::regex_match(name, allowed)) {
        throw ConfigError("site.name '" + name +
                          "' may only contain letters, digits, '_', '-' and '.'");
    }
}

} // namespace

std::string normalize_minus(const std::string& value) {
    static const char* const kDashes[] = {
        "\xE2\x88\x92", // U+2212 MINUS SIGN
        "\xE2\x80\x92", // U+2012 FIGURE DASH
        "\xE2\x80\x93", // U+2013 EN DASH
        "\xEF\xB9\xA3", // U+FE63 SMALL HYPHEN-MINUS
        "\xEF\xBC\x8D", // U+FF0D FULLWIDTH HYPHEN-MINUS
    };

    std::string out = value;
    for (const char* dash : kDashes) {
        const std::string needle(dash);
        size_t pos = 0;
        while ((pos = out.find(needle, pos)) != std::string::npos) {
            out.replace(pos, needle.size(), "-");
            pos += 1;
        }
    }
    return out;
}

double compute_erp(double power_watts, double gain_dbi) {
    return power_watts * std::pow(10.0, gain_dbi / 10.0);
}

ResolutionProfile select_resolution_profile(int resolution, const ToolPaths& paths) {
    ResolutionProfile profile;
    profile.resolution = resolution;
    if (resolution == 3600) {
        profile.high_definition = true;
        profile.engine_bin = paths.engine_hd_bin;
        profile.terrain_dir = paths.sdf_dir_30m;
        profile.label = "HD 30m";
    } else {
        profile.high_definition = false;
        profile.engine_bin = paths.engine_bin;
        profile.terrain_dir = paths.sdf_dir_90m;
        profile.label = "Standard 90m";
    }
    return profile;
}

ResolvedConfig resolve_config(const RawConfig& raw, std::ostream& diag) {
    const auto& keys = known_keys();
    for (const auto& entry : raw) {
        if (std::find(keys.begin(), keys.end(), entry.first) == keys.end()) {
            throw ConfigError("unknown parameter '" + entry.first + "'");
        }
    }

    RawReader r(raw);
    ResolvedConfig cfg;
    SiteParameters& s = cfg.site;

    // Site
    s.name = r.text("site.name").value_or("");
    validate_site_name(s.name);
    s.description = r.text("site.description").value_or("RF Coverage Map");

    // Transmitter
    s.tx_lat = r.required_number("transmitter.lat");
    s.tx_lon = r.required_number("transmitter.lon");
    if (s.tx_lat < -90.0 || s.tx_lat > 90.0) {
        throw ConfigError("transmitter.lat must be in [-90,90], got " +
                          core::format_number(s.tx_lat));
    }
    if (std::fabs(s.tx_lat) > kMaxPolicyLatitude) {
        throw ConfigError("transmitter.lat " + core::format_number(s.tx_lat) +
                          " is outside the supported envelope [-70,70]");
    }
    if (s.tx_lon < -180.0 || s.tx_lon > 180.0) {
        throw ConfigError("transmitter.lon must be in [-180,180], got " +
                          core::format_number(s.tx_lon));
    }
    s.tx_height = r.required_number("transmitter.height");
    if (s.tx_height < 0.0) {
        throw ConfigError("transmitter.height must be >= 0");
    }
    s.frequency_mhz = r.required_number("transmitter.frequency_mhz");
    check_range<double>("transmitter.frequency_mhz", s.frequency_mhz,
                        kMinFrequencyMhz, kMaxFrequencyMhz);
    s.power_watts = r.required_number("transmitter.power_watts");
    if (s.power_watts <= 0.0) {
        throw ConfigError("transmitter.power_watts must be > 0");
    }
    s.antenna_gain_dbi = r.required_number("transmitter.antenna_gain_dbi");
    s.erp_watts = compute_erp(s.power_watts, s.antenna_gain_dbi);

    // Receiver
    s.rx_height = r.required_number("receiver.height");
    if (s.rx_height < 0.0) {
        throw ConfigError("receiver.height must be >= 0");
    }
    s.rx_threshold = r.required_number("receiver.threshold");
    s.rx_gain = r.number("receiver.gain");

    // Coverage
    s.radius = r.required_number("coverage.radius");
    if (s.radius <= 0.0) {
        throw ConfigError("coverage.radius must be > 0");
    }
    const auto resolution = r.integer("coverage.resolution");
    if (!resolution) {
        throw ConfigError("coverage.resolution is required");
    }
    if (*resolution != 300 && *resolution != 600 && *resolution != 1200 &&
        *resolution != 3600) {
        throw ConfigError("coverage.resolution must be one of 300, 600, 1200, 3600, got " +
                          std::to_string(*resolution));
    }
    s.resolution = *resolution;

    // Propagation model
    const auto model = r.integer("model.propagation_model");
    check_range<int>("model.propagation_model", model, 1, 12);
    s.model = static_cast<PropagationModel>(model.value_or(1));
    s.model_mode = r.integer("model.propagation_mode");
    check_range<int>("model.propagation_mode", s.model_mode, 1, 3);
    s.reliability = r.integer("model.reliability");
    check_range<int>("model.reliability", s.reliability, 1, 99);
    s.confidence = r.integer("model.confidence");
    check_range<int>("model.confidence", s.confidence, 1, 99);

    // Terrain
    s.terrain_code = r.integer("terrain.code");
    check_range<int>("terrain.code", s.terrain_code, 1, 6);
    s.terrain_dielectric = r.number("terrain.dielectric");
    check_range<double>("terrain.dielectric", s.terrain_dielectric, 2.0, 80.0);
    s.terrain_conductivity = r.number("terrain.conductivity");
    check_range<double>("terrain.conductivity", s.terrain_conductivity, 0.0001, 0.01);
    s.climate_code = r.integer("terrain.climate_code");
    check_range<int>("terrain.climate_code", s.climate_code, 1, 7);
    s.ground_clutter = r.number("terrain.ground_clutter");
    if (s.ground_clutter && *s.ground_clutter < 0.0) {
        throw ConfigError("terrain.ground_clutter must be >= 0");
    }

    // Antenna
    s.antenna_pattern = r.text("antenna.pattern");
    s.antenna_rotation = r.number("antenna.rotation");
    check_range<double>("antenna.rotation", s.antenna_rotation, 0.0, 359.0);
    s.antenna_downtilt = r.number("antenna.downtilt");
    check_range<double>("antenna.downtilt", s.antenna_downtilt, -10.0, 90.0);
    s.antenna_downtilt_direction = r.number("antenna.downtilt_direction");
    check_range<double>("antenna.downtilt_direction", s.antenna_downtilt_direction, 0.0, 359.0);
    s.horizontal_polarization = r.boolean("antenna.horizontal_polarization", false);

    // Output flags
    s.units = r.boolean("output.metric", true) ? UnitSystem::METRIC : UnitSystem::IMPERIAL;
    s.output_unit = r.boolean("output.dbm", true) ? OutputUnit::POWER_DBM
                                                  : OutputUnit::FIELD_STRENGTH_DBUV;
    s.knife_edge_diffraction = r.boolean("output.knife_edge_diffraction", false);
    s.terrain_background = r.boolean("output.terrain_background", false);
    s.keep_raster = r.boolean("output.keep_raster", true);
    s.debug = r.boolean("output.debug", false);

    cfg.output.create_kmz = r.boolean("output.create_kmz", true);
    cfg.output.write_manifest = r.boolean("output.write_manifest", false);
    cfg.output.write_event_log = r.boolean("output.write_event_log", false);
    cfg.output.manifest_image_prefix = r.text("output.manifest_image_prefix").value_or("");

    // Paths
    cfg.paths.engine_bin = r.text("paths.engine_bin").value_or("");
    cfg.paths.engine_hd_bin = r.text("paths.engine_hd_bin").value_or("");
    cfg.paths.sdf_dir_90m = r.text("paths.sdf_dir_90m").value_or("");
    cfg.paths.sdf_dir_30m = r.text("paths.sdf_dir_30m").value_or("");
    cfg.paths.output_dir = r.required_text("paths.output_dir");
    if (auto color = r.text("paths.color_file")) {
        cfg.paths.color_file = fs::path(*color);
    }
    cfg.paths.zip_bin = r.text("paths.zip_bin").value_or("zip");

    cfg.profile = select_resolution_profile(s.resolution, cfg.paths);
    if (cfg.profile.engine_bin.empty()) {
        throw ConfigError(std::string(cfg.profile.high_definition ? "paths.engine_hd_bin"
                                                                  : "paths.engine_bin") +
                          " is required for resolution " + std::to_string(s.resolution));
    }
    if (cfg.profile.terrain_dir.empty()) {
        throw ConfigError(std::string(cfg.profile.high_definition ? "paths.sdf_dir_30m"
                                                                  : "paths.sdf_dir_90m") +
                          " is required for resolution " + std::to_string(s.resolution));
    }

    diag << "[CONFIG] Using " << (cfg.profile.high_definition ? "HD" : "standard")
         << " binary for " << s.resolution << " resolution (" << cfg.profile.label
         << ", " << (cfg.profile.high_definition ? "-hd.sdf" : ".sdf") << " tiles)\n"
         << "[CONFIG] Using SDF directory: " << cfg.profile.terrain_dir.string() << "\n";

    return cfg;
}

} // namespace covmap::config
