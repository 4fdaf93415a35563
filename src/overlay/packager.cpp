#include "covmap/overlay/packager.hpp"
#include "covmap/core/errors.hpp"
#include "covmap/core/utils.hpp"
#include "covmap/engine/process.hpp"
#include "covmap/overlay/kml.hpp"
#include "covmap/overlay/manifest.hpp"

#include <stdexcept>
#include <system_error>

namespace covmap::overlay {

fs::path resolve_zip_tool(const std::string& zip_bin) {
    if (zip_bin.empty()) {
        throw PackagingFailed("no archive tool configured");
    }
    auto found = core::find_in_path(zip_bin);
    if (!found) {
        throw PackagingFailed("archive tool '" + zip_bin + "' not found or not executable");
    }
    return *found;
}

fs::path create_kmz(const fs::path& output_dir, const std::string& site_name,
                    const std::string& zip_bin, std::ostream& diag) {
    const std::string kml = site_name + ".kml";
    const std::string png = site_name + ".png";
    const std::string kmz = site_name + ".kmz";

    for (const auto& member : {kml, png}) {
        if (!fs::is_regular_file(output_dir / member)) {
            throw PackagingFailed("missing archive member " + (output_dir / member).string());
        }
    }

    const fs::path zip = resolve_zip_tool(zip_bin);

    std::error_code ec;
    fs::remove(output_dir / kmz, ec);
    if (ec) {
        throw PackagingFailed("cannot remove stale " + (output_dir / kmz).string() + ": " +
                              ec.message());
    }

    engine::ProcessResult result;
    try {
        result = engine::run_process(zip, {"-q", "-X", kmz, kml, png}, output_dir,
                                     [&diag](const std::string& line) {
                                         diag << "[PACKAGE] " << line << "\n";
                                     });
    } catch (const std::runtime_error& e) {
        throw PackagingFailed(e.what());
    }
    if (!result.ok()) {
        std::string msg = zip.string() + " exited with status " + std::to_string(result.exit_code);
        const std::string tail = result.tail_text();
        if (!tail.empty()) msg += "\n" + tail;
        throw PackagingFailed(msg);
    }

    const fs::path archive = output_dir / kmz;
    if (!fs::is_regular_file(archive)) {
        throw PackagingFailed(archive.string() + " was not created");
    }
    return archive;
}

OverlayPackage package_overlay(const config::ResolvedConfig& cfg, const BoundingBox& bounds,
                               const std::optional<fs::path>& retained_raster,
                               std::ostream& diag) {
    const SiteParameters& site = cfg.site;
    const fs::path& out_dir = cfg.paths.output_dir;

    OverlayPackage pkg;
    pkg.site_name = site.name;
    pkg.image_path = out_dir / (site.name + ".png");
    pkg.bounds = bounds;
    pkg.description = site.description;
    pkg.raster_path = retained_raster;

    pkg.descriptor_path = write_kml(out_dir, site, bounds);
    diag << "[PACKAGE] KML created: " << pkg.descriptor_path.string() << std::endl;

    if (cfg.output.write_manifest) {
        pkg.manifest_path = write_manifest(out_dir, site, bounds,
                                           cfg.output.manifest_image_prefix);
        diag << "[PACKAGE] Manifest created: " << pkg.manifest_path->string() << std::endl;
        pkg.index_path = update_manifest_index(
            out_dir, cfg.output.manifest_image_prefix + pkg.manifest_path->filename().string());
        diag << "[PACKAGE] Index updated: " << pkg.index_path->string() << std::endl;
    }

    if (cfg.output.create_kmz) {
        pkg.archive_path = create_kmz(out_dir, site.name, cfg.paths.zip_bin, diag);
        diag << "[PACKAGE] KMZ created: " << pkg.archive_path->string() << std::endl;
    }
    return pkg;
}

} // namespace covmap::overlay
