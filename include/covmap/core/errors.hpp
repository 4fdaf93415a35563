#pragma once

#include <stdexcept>
#include <string>

namespace covmap {

class CovmapError : public std::runtime_error {
public:
    CovmapError(const std::string& stage, const std::string& message)
        : std::runtime_error(message), stage_(stage) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

class ConfigError : public CovmapError {
public:
    explicit ConfigError(const std::string& message)
        : CovmapError("CONFIG", "Config error: " + message) {}
};

// Engine stage

class EngineNotFound : public CovmapError {
public:
    explicit EngineNotFound(const std::string& message)
        : CovmapError("ENGINE", "Engine not found: " + message) {}
};

class EngineExecutionFailed : public CovmapError {
public:
    explicit EngineExecutionFailed(const std::string& message)
        : CovmapError("ENGINE", "Engine execution failed: " + message) {}
};

// Zero exit status but no raster on disk: the engine broke its contract.
class OutputMissing : public CovmapError {
public:
    explicit OutputMissing(const std::string& message)
        : CovmapError("ENGINE", "Engine output missing: " + message) {}
};

// Raster stage

class ConversionFailed : public CovmapError {
public:
    explicit ConversionFailed(const std::string& message)
        : CovmapError("RASTER", "Raster conversion failed: " + message) {}
};

class TransparencyMaskFailed : public CovmapError {
public:
    explicit TransparencyMaskFailed(const std::string& message)
        : CovmapError("RASTER", "Transparency mask failed: " + message) {}
};

// Package stage

class DescriptorWriteFailed : public CovmapError {
public:
    explicit DescriptorWriteFailed(const std::string& message)
        : CovmapError("PACKAGE", "Descriptor write failed: " + message) {}
};

class PackagingFailed : public CovmapError {
public:
    explicit PackagingFailed(const std::string& message)
        : CovmapError("PACKAGE", "Packaging failed: " + message) {}
};

} // namespace covmap
