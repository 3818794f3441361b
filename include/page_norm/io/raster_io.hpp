#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace page_norm::io {

// Decoded full-resolution source, 8-bit, gray or BGR
struct SourceRaster {
    cv::Mat pixels;
    int width = 0;
    int height = 0;
    std::optional<double> density;
};

// Initializes the image codec library once per process. Safe to call repeatedly.
void initialize_codecs(const char* program_path = nullptr);

bool is_raster_image_path(const fs::path& path);

// Throws DecodeError when the file cannot be decoded or has a zero dimension.
SourceRaster load_source_raster(const fs::path& path);

// Pixel density (dots per inch) from the header resolution, falling back to EXIF
// for JPEG. Throws DecodeError when the header cannot be read.
std::optional<double> read_density_hint(const std::vector<uint8_t>& bytes);
std::optional<double> read_density_hint(const fs::path& path);

cv::Mat to_gray_u8(const cv::Mat& raster);

// Grayscale preview whose longer side is at most max_dim.
PreviewRaster make_preview(const cv::Mat& raster, int max_dim);

// Encodes as configured with the density stored in the header. Throws OutputError.
void write_raster_with_dpi(const fs::path& path, const cv::Mat& raster, double dpi,
                           const config::OutputConfig& cfg);

std::string output_extension(const config::OutputConfig& cfg);

} // namespace page_norm::io
