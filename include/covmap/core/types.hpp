#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace covmap {

namespace fs = std::filesystem;

// Unit system for heights and radius
enum class UnitSystem {
    METRIC,   // meters / kilometers
    IMPERIAL  // feet / miles
};

inline std::string height_unit(UnitSystem units) {
    return units == UnitSystem::METRIC ? "m" : "ft";
}

inline std::string distance_unit(UnitSystem units) {
    return units == UnitSystem::METRIC ? "km" : "mi";
}

// Output quantity reported by the engine
enum class OutputUnit {
    POWER_DBM,
    FIELD_STRENGTH_DBUV
};

inline std::string output_unit_to_string(OutputUnit unit) {
    switch (unit) {
        case OutputUnit::POWER_DBM: return "dBm";
        case OutputUnit::FIELD_STRENGTH_DBUV: return "dBuV/m";
        default: return "UNKNOWN";
    }
}

// Signal-Server propagation model ids (-pm)
enum class PropagationModel {
    ITM = 1,
    LOS = 2,
    HATA = 3,
    ECC33 = 4,
    SUI = 5,
    COST_HATA = 6,
    FSPL = 7,
    ITWOM = 8,
    ERICSSON = 9,
    PLANE_EARTH = 10,
    EGLI = 11,
    SOIL = 12
};

inline std::string propagation_model_to_string(PropagationModel model) {
    switch (model) {
        case PropagationModel::ITM: return "ITM";
        case PropagationModel::LOS: return "LOS";
        case PropagationModel::HATA: return "Hata";
        case PropagationModel::ECC33: return "ECC33";
        case PropagationModel::SUI: return "SUI";
        case PropagationModel::COST_HATA: return "COST-Hata";
        case PropagationModel::FSPL: return "FSPL";
        case PropagationModel::ITWOM: return "ITWOM";
        case PropagationModel::ERICSSON: return "Ericsson";
        case PropagationModel::PLANE_EARTH: return "Plane Earth";
        case PropagationModel::EGLI: return "Egli";
        case PropagationModel::SOIL: return "Soil";
        default: return "UNKNOWN";
    }
}

inline int propagation_model_to_int(PropagationModel model) {
    return static_cast<int>(model);
}

// Validated site / transmitter / receiver parameters. Built once by the
// config resolver and read-only afterwards.
struct SiteParameters {
    std::string name;
    std::string description;

    // Transmitter
    double tx_lat = 0.0;
    double tx_lon = 0.0;
    double tx_height = 0.0;
    double frequency_mhz = 0.0;
    double power_watts = 0.0;
    double antenna_gain_dbi = 0.0;
    double erp_watts = 0.0;  // derived: power * 10^(gain/10)

    // Receiver
    double rx_height = 0.0;
    double rx_threshold = 0.0;
    std::optional<double> rx_gain;  // dBd

    // Coverage area
    double radius = 0.0;  // km (METRIC) or miles (IMPERIAL)
    int resolution = 1200; // pixels per tile

    // Propagation model
    PropagationModel model = PropagationModel::ITM;
    std::optional<int> model_mode;  // 1=Urban, 2=Suburban, 3=Rural
    std::optional<int> reliability;
    std::optional<int> confidence;

    // Terrain
    std::optional<int> terrain_code;
    std::optional<double> terrain_dielectric;
    std::optional<double> terrain_conductivity;
    std::optional<int> climate_code;
    std::optional<double> ground_clutter;

    // Antenna
    std::optional<std::string> antenna_pattern;
    std::optional<double> antenna_rotation;
    std::optional<double> antenna_downtilt;
    std::optional<double> antenna_downtilt_direction;
    bool horizontal_polarization = false;

    // Output flags
    UnitSystem units = UnitSystem::METRIC;
    OutputUnit output_unit = OutputUnit::POWER_DBM;
    bool knife_edge_diffraction = false;
    bool terrain_background = false;
    bool keep_raster = true;
    bool debug = false;
};

// Engine binary / terrain data pairing for one resolution tier
struct ResolutionProfile {
    int resolution = 0;
    bool high_definition = false;
    fs::path engine_bin;
    fs::path terrain_dir;
    std::string label;  // "HD 30m" or "Standard 90m"
};

struct BoundingBox {
    double north = 0.0;
    double south = 0.0;
    double east = 0.0;
    double west = 0.0;
};

// Raw raster written by the engine
struct RasterArtifact {
    fs::path path;
};

// Final per-run output set
struct OverlayPackage {
    std::string site_name;
    fs::path image_path;
    fs::path descriptor_path;
    BoundingBox bounds;
    std::string description;
    std::optional<fs::path> archive_path;
    std::optional<fs::path> manifest_path;
    std::optional<fs::path> index_path;   // shared index.json listing manifests
    std::optional<fs::path> raster_path;  // retained raw raster
};

// Pipeline stage enumeration
enum class Stage {
    CONFIG = 0,
    BOUNDS = 1,
    ENGINE = 2,
    RASTER = 3,
    PACKAGE = 4
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::CONFIG: return "CONFIG";
        case Stage::BOUNDS: return "BOUNDS";
        case Stage::ENGINE: return "ENGINE";
        case Stage::RASTER: return "RASTER";
        case Stage::PACKAGE: return "PACKAGE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace covmap
