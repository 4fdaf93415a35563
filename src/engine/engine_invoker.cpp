#include "covmap/engine/engine_invoker.hpp"
#include "covmap/core/errors.hpp"
#include "covmap/core/utils.hpp"
#include "covmap/engine/process.hpp"

#include <stdexcept>

namespace covmap::engine {

void require_engine_binary(const fs::path& binary) {
    if (binary.empty()) {
        throw EngineNotFound("no engine binary configured");
    }
    if (!fs::exists(binary)) {
        throw EngineNotFound(binary.string() + " does not exist");
    }
    if (!core::is_executable_file(binary)) {
        throw EngineNotFound(binary.string() + " is not an executable file");
    }
}

RasterArtifact invoke_engine(const EngineInvocation& invocation, std::ostream& diag) {
    require_engine_binary(invocation.binary());

    diag << "[ENGINE] " << invocation.command_line() << std::endl;

    ProcessResult result;
    try {
        result = run_process(invocation.binary(), invocation.args(), invocation.working_dir(),
                             [&diag](const std::string& line) {
                                 diag << "[ENGINE] " << line << "\n";
                             });
    } catch (const std::runtime_error& e) {
        throw EngineExecutionFailed(e.what());
    }
    diag.flush();

    if (!result.ok()) {
        std::string msg = result.signaled
            ? "terminated by signal " + std::to_string(result.exit_code - 128)
            : "exit status " + std::to_string(result.exit_code);
        const std::string tail = result.tail_text();
        if (!tail.empty()) {
            msg += "\n" + tail;
        }
        throw EngineExecutionFailed(msg);
    }

    const fs::path raster = invocation.expected_output();
    if (!fs::is_regular_file(raster)) {
        throw OutputMissing("expected " + raster.string() + " after a successful run");
    }

    diag << "[ENGINE] Raster written: " << raster.string() << std::endl;
    return RasterArtifact{raster};
}

} // namespace covmap::engine
