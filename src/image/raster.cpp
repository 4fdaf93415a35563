#include "covmap/image/raster.hpp"
#include "covmap/core/errors.hpp"

#include <opencv2/opencv.hpp>
#include <ostream>
#include <system_error>
#include <vector>

namespace covmap::image {

namespace {

const std::vector<int>& png_params() {
    // Compression level only changes the deflate effort, never the pixels.
    static const std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    return params;
}

} // namespace

bool is_sentinel_pixel(uint8_t r, uint8_t g, uint8_t b) {
    return (r == 255 && g == 255 && b == 255) || (r == 0 && g == 0 && b == 0);
}

cv::Mat make_sentinel_transparent(const cv::Mat& image) {
    if (image.empty()) {
        throw TransparencyMaskFailed("empty image");
    }
    if (image.depth() != CV_8U) {
        throw TransparencyMaskFailed("expected 8-bit samples");
    }

    cv::Mat bgr;
    switch (image.channels()) {
        case 1:
            cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            bgr = image;
            break;
        case 4:
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            throw TransparencyMaskFailed("unsupported channel count " +
                                         std::to_string(image.channels()));
    }

    std::vector<cv::Mat> planes;
    cv::split(bgr, planes);

    cv::Mat white = (planes[0] == 255) & (planes[1] == 255) & (planes[2] == 255);
    cv::Mat black = (planes[0] == 0) & (planes[1] == 0) & (planes[2] == 0);

    cv::Mat alpha(bgr.size(), CV_8UC1, cv::Scalar(255));
    alpha.setTo(0, white | black);

    planes.push_back(alpha);
    cv::Mat out;
    cv::merge(planes, out);
    return out;
}

void convert_raster_to_png(const fs::path& raster, const fs::path& png, std::ostream& diag) {
    if (!fs::is_regular_file(raster)) {
        throw ConversionFailed("raster not found: " + raster.string());
    }

    cv::Mat img;
    try {
        img = cv::imread(raster.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw ConversionFailed("cannot read " + raster.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw ConversionFailed("cannot decode " + raster.string());
    }

    bool written = false;
    try {
        written = cv::imwrite(png.string(), img, png_params());
    } catch (const cv::Exception& e) {
        throw ConversionFailed("cannot write " + png.string() + ": " + e.what());
    }
    if (!written) {
        throw ConversionFailed("cannot write " + png.string());
    }
    diag << "[RASTER] Converted " << raster.filename().string() << " -> "
         << png.filename().string() << " (" << img.cols << "x" << img.rows << ")"
         << std::endl;
}

void apply_transparency_mask(const fs::path& png, std::ostream& diag) {
    cv::Mat img;
    try {
        img = cv::imread(png.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw TransparencyMaskFailed("cannot read " + png.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw TransparencyMaskFailed("cannot decode " + png.string());
    }

    cv::Mat masked = make_sentinel_transparent(img);

    const fs::path tmp = png.parent_path() / (png.stem().string() + "_transparent.png");
    bool written = false;
    try {
        written = cv::imwrite(tmp.string(), masked, png_params());
    } catch (const cv::Exception& e) {
        throw TransparencyMaskFailed("cannot write " + tmp.string() + ": " + e.what());
    }
    if (!written) {
        throw TransparencyMaskFailed("cannot write " + tmp.string());
    }

    std::error_code ec;
    fs::rename(tmp, png, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw TransparencyMaskFailed("cannot replace " + png.string() + ": " + reason);
    }
    diag << "[RASTER] Transparency applied to " << png.filename().string() << std::endl;
}

std::optional<fs::path> post_process_raster(const RasterArtifact& raster, const fs::path& png,
                                            bool keep_raster, std::ostream& diag) {
    convert_raster_to_png(raster.path, png, diag);
    apply_transparency_mask(png, diag);

    if (keep_raster) {
        return raster.path;
    }
    std::error_code ec;
    fs::remove(raster.path, ec);
    if (ec) {
        diag << "[RASTER] Warning: could not remove " << raster.path.string() << ": "
             << ec.message() << std::endl;
        return raster.path;
    }
    return std::nullopt;
}

} // namespace covmap::image
