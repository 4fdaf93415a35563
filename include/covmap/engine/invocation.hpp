#pragma once

#include "covmap/core/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace covmap::engine {

// Raster extension written by Signal-Server next to the output prefix.
constexpr const char* kRasterExtension = ".ppm";

/**
 * Ordered flag list for the propagation engine.
 * Unset optional values are skipped so the engine applies its own default.
 */
class EngineArgs {
public:
    EngineArgs& add(const std::string& flag, const std::string& value);
    EngineArgs& add(const std::string& flag, double value);
    EngineArgs& add(const std::string& flag, int value);

    EngineArgs& add_optional(const std::string& flag, const std::optional<std::string>& value);
    EngineArgs& add_optional(const std::string& flag, const std::optional<double>& value);
    EngineArgs& add_optional(const std::string& flag, const std::optional<int>& value);

    // Bare switch, appended only when enabled.
    EngineArgs& add_switch(const std::string& flag, bool enabled);

    bool has(const std::string& flag) const;
    std::optional<std::string> value_of(const std::string& flag) const;

    std::vector<std::string> serialize() const;

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> entries_;
};

class EngineInvocation {
public:
    EngineInvocation(fs::path binary, std::vector<std::string> args,
                     fs::path working_dir, fs::path output_prefix);

    const fs::path& binary() const { return binary_; }
    const std::vector<std::string>& args() const { return args_; }
    const fs::path& working_dir() const { return working_dir_; }
    const fs::path& output_prefix() const { return output_prefix_; }

    fs::path expected_output() const;

    // Shell-quoted command line, for diagnostics and dry runs.
    std::string command_line() const;

private:
    fs::path binary_;
    std::vector<std::string> args_;
    fs::path working_dir_;
    fs::path output_prefix_;
};

EngineArgs build_engine_args(const SiteParameters& site, const ResolutionProfile& profile,
                             const std::optional<fs::path>& color_file,
                             const fs::path& output_prefix);

EngineInvocation build_engine_invocation(const SiteParameters& site,
                                         const ResolutionProfile& profile,
                                         const std::optional<fs::path>& color_file,
                                         const fs::path& output_dir);

} // namespace covmap::engine
