#pragma once

#include "covmap/core/types.hpp"
#include "covmap/engine/invocation.hpp"

#include <ostream>

namespace covmap::engine {

/**
 * Run the propagation engine and return the raster it produced.
 *
 * The binary is checked before anything is spawned (EngineNotFound).
 * Engine output is copied line by line to `diag` with an [ENGINE] tag.
 * A non-zero exit raises EngineExecutionFailed carrying the output tail;
 * a zero exit without `<prefix>.ppm` raises OutputMissing.
 */
RasterArtifact invoke_engine(const EngineInvocation& invocation, std::ostream& diag);

// Throws EngineNotFound unless `binary` is an existing executable file.
void require_engine_binary(const fs::path& binary);

} // namespace covmap::engine
