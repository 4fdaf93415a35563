#pragma once

#include "covmap/core/types.hpp"

#include <cstdint>
#include <opencv2/core.hpp>
#include <ostream>

namespace covmap::image {

// Pixels the engine paints for "no data" (pure white) and "no coverage" (pure black).
bool is_sentinel_pixel(uint8_t r, uint8_t g, uint8_t b);

// 8-bit BGR (or gray) in, 8-bit BGRA out. Alpha is 0 for sentinel pixels,
// 255 otherwise. Colour channels are copied unchanged.
cv::Mat make_sentinel_transparent(const cv::Mat& image);

// Lossless PPM -> PNG. Throws ConversionFailed.
void convert_raster_to_png(const fs::path& raster, const fs::path& png, std::ostream& diag);

// Masks `png` in place via `<stem>_transparent.png`. Throws TransparencyMaskFailed.
void apply_transparency_mask(const fs::path& png, std::ostream& diag);

/**
 * Turn the engine raster into the final overlay image at `png`.
 * The raster is removed afterwards unless `keep_raster` is set.
 * Returns the retained raster path, if any. Progress goes to `diag`.
 */
std::optional<fs::path> post_process_raster(const RasterArtifact& raster, const fs::path& png,
                                            bool keep_raster, std::ostream& diag);

} // namespace covmap::image
