#include "covmap/engine/invocation.hpp"
#include "covmap/core/utils.hpp"

#include <algorithm>

namespace covmap::engine {

EngineArgs& EngineArgs::add(const std::string& flag, const std::string& value) {
    entries_.emplace_back(flag, value);
    return *this;
}

EngineArgs& EngineArgs::add(const std::string& flag, double value) {
    return add(flag, core::format_exact(value));
}

EngineArgs& EngineArgs::add(const std::string& flag, int value) {
    return add(flag, std::to_string(value));
}

EngineArgs& EngineArgs::add_optional(const std::string& flag,
                                     const std::optional<std::string>& value) {
    if (value && !value->empty()) add(flag, *value);
    return *this;
}

EngineArgs& EngineArgs::add_optional(const std::string& flag,
                                     const std::optional<double>& value) {
    if (value) add(flag, *value);
    return *this;
}

EngineArgs& EngineArgs::add_optional(const std::string& flag,
                                     const std::optional<int>& value) {
    if (value) add(flag, *value);
    return *this;
}

EngineArgs& EngineArgs::add_switch(const std::string& flag, bool enabled) {
    if (enabled) entries_.emplace_back(flag, std::nullopt);
    return *this;
}

bool EngineArgs::has(const std::string& flag) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const auto& e) { return e.first == flag; });
}

std::optional<std::string> EngineArgs::value_of(const std::string& flag) const {
    for (const auto& e : entries_) {
        if (e.first == flag) return e.second;
    }
    return std::nullopt;
}

std::vector<std::string> EngineArgs::serialize() const {
    std::vector<std::string> out;
    out.reserve(entries_.size() * 2);
    for (const auto& [flag, value] : entries_) {
        out.push_back(flag);
        if (value) out.push_back(*value);
    }
    return out;
}

EngineInvocation::EngineInvocation(fs::path binary, std::vector<std::string> args,
                                   fs::path working_dir, fs::path output_prefix)
    : binary_(std::move(binary)), args_(std::move(args)),
      working_dir_(std::move(working_dir)), output_prefix_(std::move(output_prefix)) {}

fs::path EngineInvocation::expected_output() const {
    return fs::path(output_prefix_.string() + kRasterExtension);
}

std::string EngineInvocation::command_line() const {
    std::vector<std::string> parts;
    parts.reserve(args_.size() + 1);
    parts.push_back(core::shell_quote(binary_.string()));
    for (const auto& a : args_) {
        parts.push_back(core::shell_quote(a));
    }
    return core::join(parts, " ");
}

EngineArgs build_engine_args(const SiteParameters& site, const ResolutionProfile& profile,
                             const std::optional<fs::path>& color_file,
                             const fs::path& output_prefix) {
    EngineArgs args;
    args.add("-sdf", profile.terrain_dir.string());
    if (color_file) args.add("-color", color_file->string());
    args.add("-lat", site.tx_lat)
        .add("-lon", site.tx_lon)
        .add("-txh", site.tx_height)
        .add("-f", site.frequency_mhz)
        .add("-erp", site.erp_watts)
        .add("-rxh", site.rx_height)
        .add("-rt", site.rx_threshold)
        .add_optional("-rxg", site.rx_gain)
        .add_optional("-te", site.terrain_code)
        .add_optional("-terdic", site.terrain_dielectric)
        .add_optional("-tercon", site.terrain_conductivity)
        .add_optional("-cl", site.climate_code)
        .add_optional("-gc", site.ground_clutter)
        .add("-pm", propagation_model_to_int(site.model))
        .add_optional("-pe", site.model_mode)
        .add_optional("-rel", site.reliability)
        .add_optional("-conf", site.confidence)
        .add_optional("-ant", site.antenna_pattern)
        .add_optional("-rot", site.antenna_rotation)
        .add_optional("-dt", site.antenna_downtilt)
        .add_optional("-dtdir", site.antenna_downtilt_direction)
        .add_switch("-hp", site.horizontal_polarization)
        .add("-R", site.radius)
        .add("-res", profile.resolution)
        .add_switch("-m", site.units == UnitSystem::METRIC)
        .add_switch("-dbm", site.output_unit == OutputUnit::POWER_DBM)
        .add_switch("-ked", site.knife_edge_diffraction)
        .add_switch("-t", site.terrain_background)
        .add_switch("-dbg", site.debug)
        .add("-o", output_prefix.string());
    return args;
}

EngineInvocation build_engine_invocation(const SiteParameters& site,
                                         const ResolutionProfile& profile,
                                         const std::optional<fs::path>& color_file,
                                         const fs::path& output_dir) {
    const fs::path prefix = output_dir / site.name;
    EngineArgs args = build_engine_args(site, profile, color_file, prefix);
    return EngineInvocation(profile.engine_bin, args.serialize(), fs::current_path(), prefix);
}

} // namespace covmap::engine
