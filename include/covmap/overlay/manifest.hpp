#pragma once

#include "covmap/core/types.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace covmap::overlay {

using json = nlohmann::json;

constexpr double kMetersPerFoot = 0.3048;

// Leaflet-friendly description of the overlay:
//   site     {name, lat, lon, antenna_agl_m, antenna_agl_note}
//   overlays [{name, image, bounds [[s,w],[n,e]], rotation}]
json build_manifest(const SiteParameters& site, const BoundingBox& bounds,
                    const std::string& image_ref);

// Writes <output_dir>/<site>.manifest.json; the image reference is
// `image_prefix` + "<site>.png". Throws DescriptorWriteFailed.
fs::path write_manifest(const fs::path& output_dir, const SiteParameters& site,
                        const BoundingBox& bounds, const std::string& image_prefix);

// Adds `manifest_ref` to <output_dir>/index.json ({"manifests": [...]}, sorted,
// no duplicates), creating the file if needed. Throws DescriptorWriteFailed.
fs::path update_manifest_index(const fs::path& output_dir, const std::string& manifest_ref);

} // namespace covmap::overlay
