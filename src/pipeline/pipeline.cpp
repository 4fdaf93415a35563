#include "covmap/pipeline/pipeline.hpp"
#include "covmap/core/errors.hpp"
#include "covmap/core/utils.hpp"
#include "covmap/engine/engine_invoker.hpp"
#include "covmap/engine/invocation.hpp"
#include "covmap/geo/bounds.hpp"
#include "covmap/image/raster.hpp"
#include "covmap/overlay/packager.hpp"

#include <fstream>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace covmap::pipeline {

using core::json;

namespace {

json bounds_json(const BoundingBox &b) {
    return {{"north", b.north}, {"south", b.south}, {"east", b.east}, {"west", b.west}};
}

// Runs `body` between stage_start and stage_end. On failure the stage is
// closed with status "error" and the exception is rethrown unchanged.
template <typename Fn>
auto run_stage(Stage stage, const std::string &run_id, core::EventEmitter &emitter,
               std::ostream &events, Fn &&body) -> decltype(body(std::declval<json &>())) {
    emitter.stage_start(run_id, stage, events);
    json extra = json::object();
    try {
        if constexpr (std::is_void_v<decltype(body(extra))>) {
            body(extra);
            emitter.stage_end(run_id, stage, "ok", extra, events);
        } else {
            auto value = body(extra);
            emitter.stage_end(run_id, stage, "ok", extra, events);
            return value;
        }
    } catch (const std::exception &e) {
        emitter.stage_end(run_id, stage, "error", {{"error", e.what()}}, events);
        throw;
    }
}

} // namespace

void preflight(const config::ResolvedConfig &cfg) {
    engine::require_engine_binary(cfg.profile.engine_bin);
    if (cfg.output.create_kmz) {
        overlay::resolve_zip_tool(cfg.paths.zip_bin);
    }
}

PipelineResult run_coverage_pipeline(const config::ResolvedConfig &cfg,
                                     const std::string &run_id,
                                     core::EventEmitter &emitter,
                                     std::ostream &events, std::ostream &diag,
                                     bool dry_run) {
    const SiteParameters &site = cfg.site;
    PipelineResult result;
    result.dry_run = dry_run;

    result.bounds = run_stage(Stage::BOUNDS, run_id, emitter, events, [&](json &extra) {
        BoundingBox b = geo::compute_bounds(site.tx_lat, site.tx_lon, site.radius, site.units);
        extra["bounds"] = bounds_json(b);
        return b;
    });

    const engine::EngineInvocation invocation = engine::build_engine_invocation(
        site, cfg.profile, cfg.paths.color_file, cfg.paths.output_dir);
    result.engine_command = invocation.command_line();

    if (dry_run) {
        for (Stage s : {Stage::ENGINE, Stage::RASTER, Stage::PACKAGE}) {
            emitter.stage_start(run_id, s, events);
            emitter.stage_end(run_id, s, "skipped", {{"reason", "dry_run"}}, events);
        }
        diag << "[ENGINE] Dry run, command not executed:" << std::endl;
        diag << "[ENGINE] " << result.engine_command << std::endl;
        return result;
    }

    const RasterArtifact raster =
        run_stage(Stage::ENGINE, run_id, emitter, events, [&](json &extra) {
            preflight(cfg);
            std::error_code ec;
            fs::create_directories(cfg.paths.output_dir, ec);
            if (ec || !fs::is_directory(cfg.paths.output_dir)) {
                throw EngineExecutionFailed("cannot create output directory " +
                                            cfg.paths.output_dir.string() +
                                            (ec ? ": " + ec.message() : ""));
            }
            extra["binary"] = cfg.profile.engine_bin.string();
            extra["profile"] = cfg.profile.label;
            RasterArtifact a = engine::invoke_engine(invocation, diag);
            extra["raster"] = a.path.string();
            return a;
        });

    const fs::path png = cfg.paths.output_dir / (site.name + ".png");
    const std::optional<fs::path> retained =
        run_stage(Stage::RASTER, run_id, emitter, events, [&](json &extra) {
            auto kept = image::post_process_raster(raster, png, site.keep_raster, diag);
            extra["image"] = png.string();
            extra["raster_kept"] = kept.has_value();
            if (kept && !site.keep_raster) {
                emitter.warning(run_id, "raw raster left in place: " + kept->string(), events);
            }
            return kept;
        });

    result.package = run_stage(Stage::PACKAGE, run_id, emitter, events, [&](json &extra) {
        OverlayPackage pkg = overlay::package_overlay(cfg, result.bounds, retained, diag);
        extra["kml"] = pkg.descriptor_path.string();
        if (pkg.archive_path) extra["kmz"] = pkg.archive_path->string();
        if (pkg.manifest_path) extra["manifest"] = pkg.manifest_path->string();
        if (pkg.index_path) extra["index"] = pkg.index_path->string();
        result.package = pkg;
        result.run_record = write_run_record(cfg, result, run_id);
        extra["run_record"] = result.run_record->string();
        return pkg;
    });

    return result;
}

fs::path write_run_record(const config::ResolvedConfig &cfg,
                          const PipelineResult &result,
                          const std::string &run_id) {
    YAML::Emitter yaml;
    yaml << config::to_yaml(cfg);

    json artifacts = json::object();
    if (result.package) {
        const OverlayPackage &pkg = *result.package;
        std::vector<fs::path> files = {pkg.image_path, pkg.descriptor_path};
        if (pkg.archive_path) files.push_back(*pkg.archive_path);
        if (pkg.manifest_path) files.push_back(*pkg.manifest_path);
        if (pkg.raster_path) files.push_back(*pkg.raster_path);
        for (const auto &f : files) {
            std::error_code ec;
            const auto bytes = fs::file_size(f, ec);
            const std::string digest = ec ? std::string() : core::sha256_file(f);
            if (ec || digest.empty()) {
                throw DescriptorWriteFailed("cannot read artifact " + f.string());
            }
            artifacts[f.filename().string()] = {
                {"path", f.string()},
                {"bytes", bytes},
                {"sha256", digest},
            };
        }
    }

    json record = {
        {"run_id", run_id},
        {"ts", core::get_iso_timestamp()},
        {"site", cfg.site.name},
        {"profile", {
            {"resolution", cfg.profile.resolution},
            {"label", cfg.profile.label},
            {"engine_bin", cfg.profile.engine_bin.string()},
            {"terrain_dir", cfg.profile.terrain_dir.string()},
        }},
        {"erp_watts", cfg.site.erp_watts},
        {"bounds", bounds_json(result.bounds)},
        {"engine_command", result.engine_command},
        {"config_yaml", std::string(yaml.c_str())},
        {"artifacts", artifacts},
    };

    const fs::path path = cfg.paths.output_dir / (cfg.site.name + ".run.json");
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw DescriptorWriteFailed("cannot open " + path.string());
    }
    out << record.dump(2) << "\n";
    out.close();
    if (!out) {
        throw DescriptorWriteFailed("cannot write " + path.string());
    }
    return path;
}

void print_summary(const config::ResolvedConfig &cfg, const PipelineResult &result,
                   std::ostream &out) {
    const SiteParameters &s = cfg.site;
    const std::string rule(79, '=');
    auto num = [](double v) { return core::format_number(v); };

    out << "\n" << rule << "\n"
        << (result.dry_run ? "                         RF Coverage Map Dry Run\n"
                           : "                         RF Coverage Map Complete\n")
        << rule << "\n\n";
    out << "  Site Name:      " << s.name << "\n";
    out << "  Location:       " << num(s.tx_lat) << ", " << num(s.tx_lon) << "\n";
    out << "  Frequency:      " << num(s.frequency_mhz) << " MHz\n";
    out << "  ERP:            " << num(s.erp_watts) << " W\n";
    out << "  TX Height:      " << num(s.tx_height) << " " << height_unit(s.units) << "\n";
    out << "  Radius:         " << num(s.radius) << " " << distance_unit(s.units) << "\n";
    out << "  Threshold:      " << num(s.rx_threshold) << " "
        << output_unit_to_string(s.output_unit) << "\n";
    out << "  Model:          " << propagation_model_to_int(s.model) << " ("
        << propagation_model_to_string(s.model) << ")\n";
    out << "  Resolution:     " << cfg.profile.resolution << " ppd (" << cfg.profile.label
        << ")\n";
    out << "  Bounds:         N " << num(result.bounds.north) << "  S "
        << num(result.bounds.south) << "  E " << num(result.bounds.east) << "  W "
        << num(result.bounds.west) << "\n\n";

    if (result.package) {
        const OverlayPackage &pkg = *result.package;
        out << "  Output Files:\n";
        out << "    PNG:          " << pkg.image_path.string() << "\n";
        out << "    KML:          " << pkg.descriptor_path.string() << "\n";
        if (pkg.archive_path) out << "    KMZ:          " << pkg.archive_path->string() << "\n";
        if (pkg.raster_path) out << "    PPM:          " << pkg.raster_path->string() << "\n";
        if (pkg.manifest_path)
            out << "    Manifest:     " << pkg.manifest_path->string() << "\n";
        if (pkg.index_path) out << "    Index:        " << pkg.index_path->string() << "\n";
        if (result.run_record)
            out << "    Run record:   " << result.run_record->string() << "\n";
    } else {
        out << "  Engine command:\n    " << result.engine_command << "\n";
    }
    out << "\n" << rule << std::endl;
}

} // namespace covmap::pipeline
