#pragma once

#include "covmap/core/types.hpp"

#include <string>

namespace covmap::overlay {

// KML 2.2 document with one GroundOverlay and a transmitter Placemark.
// `image_href` is written as-is into the overlay Icon.
std::string render_kml(const SiteParameters& site, const BoundingBox& bounds,
                       const std::string& image_href);

// Writes <output_dir>/<site>.kml referencing <site>.png. Throws DescriptorWriteFailed.
fs::path write_kml(const fs::path& output_dir, const SiteParameters& site,
                   const BoundingBox& bounds);

} // namespace covmap::overlay
