#pragma once

#include "covmap/config/configuration.hpp"
#include "covmap/core/types.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace covmap::overlay {

// Locates the archive tool: a path is checked directly, a bare name is
// searched in PATH. Throws PackagingFailed.
fs::path resolve_zip_tool(const std::string& zip_bin);

// Builds <output_dir>/<site>.kmz holding exactly <site>.kml and <site>.png.
// Any existing archive is replaced. Throws PackagingFailed.
fs::path create_kmz(const fs::path& output_dir, const std::string& site_name,
                    const std::string& zip_bin, std::ostream& diag);

/**
 * Final packaging step: KML descriptor, optional manifest and optional KMZ
 * next to the already masked `<site>.png`.
 */
OverlayPackage package_overlay(const config::ResolvedConfig& cfg, const BoundingBox& bounds,
                               const std::optional<fs::path>& retained_raster,
                               std::ostream& diag);

} // namespace covmap::overlay
