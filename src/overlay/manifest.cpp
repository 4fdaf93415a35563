#include "covmap/overlay/manifest.hpp"
#include "covmap/core/errors.hpp"

#include <algorithm>
#include <fstream>
#include <vector>

namespace covmap::overlay {

json build_manifest(const SiteParameters& site, const BoundingBox& bounds,
                    const std::string& image_ref) {
    const bool metric = site.units == UnitSystem::METRIC;
    const double agl_m = metric ? site.tx_height : site.tx_height * kMetersPerFoot;

    json overlay = {
        {"name", site.name},
        {"image", image_ref},
        {"bounds", json::array({json::array({bounds.south, bounds.west}),
                                json::array({bounds.north, bounds.east})})},
        {"rotation", nullptr}
    };

    return {
        {"site", {
            {"name", site.name},
            {"lat", site.tx_lat},
            {"lon", site.tx_lon},
            {"antenna_agl_m", agl_m},
            {"antenna_agl_note", metric ? "" : "converted from feet"}
        }},
        {"overlays", json::array({overlay})}
    };
}

fs::path write_manifest(const fs::path& output_dir, const SiteParameters& site,
                        const BoundingBox& bounds, const std::string& image_prefix) {
    const fs::path path = output_dir / (site.name + ".manifest.json");
    const json manifest = build_manifest(site, bounds, image_prefix + site.name + ".png");

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw DescriptorWriteFailed("cannot open " + path.string());
    }
    out << manifest.dump(2) << "\n";
    out.close();
    if (!out) {
        throw DescriptorWriteFailed("cannot write " + path.string());
    }
    return path;
}

fs::path update_manifest_index(const fs::path& output_dir, const std::string& manifest_ref) {
    const fs::path path = output_dir / "index.json";

    std::vector<std::string> manifests;
    if (fs::exists(path)) {
        std::ifstream in(path, std::ios::binary);
        const json existing = json::parse(in, nullptr, false);
        if (existing.is_discarded() || !existing.is_object() ||
            !existing.contains("manifests") || !existing["manifests"].is_array()) {
            throw DescriptorWriteFailed(path.string() + " is not a manifest index");
        }
        for (const auto& entry : existing["manifests"]) {
            if (entry.is_string()) manifests.push_back(entry.get<std::string>());
        }
    }
    if (std::find(manifests.begin(), manifests.end(), manifest_ref) == manifests.end()) {
        manifests.push_back(manifest_ref);
    }
    std::sort(manifests.begin(), manifests.end());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw DescriptorWriteFailed("cannot open " + path.string());
    }
    out << json{{"manifests", manifests}}.dump(2) << "\n";
    out.close();
    if (!out) {
        throw DescriptorWriteFailed("cannot write " + path.string());
    }
    return path;
}

} // namespace covmap::overlay
