#include "page_norm/io/raster_io.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <Magick++.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace page_norm::io {

namespace {

constexpr double kCmPerInch = 2.54;

// "300/1" or "72" as stored in EXIF properties
std::optional<double> parse_rational(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        const auto slash = text.find('/');
        if (slash == std::string::npos) return std::stod(text);
        const double num = std::stod(text.substr(0, slash));
        const double den = std::stod(text.substr(slash + 1));
        if (den == 0.0) return std::nullopt;
        return num / den;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<double> to_dpi(double value, Magick::ResolutionType units) {
    if (!(value > 0.0)) return std::nullopt;
    if (units == Magick::PixelsPerInchResolution) return value;
    if (units == Magick::PixelsPerCentimeterResolution) return value * kCmPerInch;
    return std::nullopt;
}

// JPEGs carrying only an EXIF APP1 block report their resolution as properties
std::optional<double> exif_density(const Magick::Image& image) {
    const auto x_res = parse_rational(image.attribute("exif:XResolution"));
    if (!x_res) return std::nullopt;
    const auto unit = parse_rational(image.attribute("exif:ResolutionUnit"));
    const int code = unit ? static_cast<int>(*unit) : 2;
    if (code == 2) return to_dpi(*x_res, Magick::PixelsPerInchResolution);
    if (code == 3) return to_dpi(*x_res, Magick::PixelsPerCentimeterResolution);
    return std::nullopt;
}

std::string channel_map(int channels) {
    if (channels == 1) return "I";
    if (channels == 4) return "BGRA";
    return "BGR";
}

} // namespace

void initialize_codecs(const char* program_path) {
    static std::once_flag once;
    std::call_once(once, [program_path]() { Magick::InitializeMagick(program_path); });
}

bool is_raster_image_path(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".tif" || ext == ".tiff";
}

std::optional<double> read_density_hint(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) return std::nullopt;
    initialize_codecs();
    try {
        Magick::Image image;
        image.quiet(true);
        image.ping(Magick::Blob(bytes.data(), bytes.size()));
        const Magick::Point density = image.density();
        if (auto dpi = to_dpi(density.x(), image.resolutionUnits())) return dpi;
        return exif_density(image);
    } catch (const Magick::Exception& e) {
        throw DecodeError(std::string("Cannot read image header: ") + e.what());
    }
}

std::optional<double> read_density_hint(const fs::path& path) {
    return read_density_hint(core::read_bytes(path));
}

SourceRaster load_source_raster(const fs::path& path) {
    std::vector<uint8_t> bytes;
    try {
        bytes = core::read_bytes(path);
    } catch (const IOError& e) {
        throw DecodeError(e.what());
    }
    if (bytes.empty()) {
        throw DecodeError("Empty file: " + path.string());
    }

    SourceRaster src;
    src.pixels = cv::imdecode(bytes, cv::IMREAD_ANYCOLOR);
    if (src.pixels.empty() || src.pixels.cols <= 0 || src.pixels.rows <= 0) {
        throw DecodeError("Unreadable image: " + path.string());
    }
    src.width = src.pixels.cols;
    src.height = src.pixels.rows;
    src.density = read_density_hint(bytes);
    return src;
}

cv::Mat to_gray_u8(const cv::Mat& raster) {
    cv::Mat gray;
    if (raster.channels() == 4) {
        cv::cvtColor(raster, gray, cv::COLOR_BGRA2GRAY);
    } else if (raster.channels() == 3) {
        cv::cvtColor(raster, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = raster;
    }
    if (gray.depth() != CV_8U) {
        cv::Mat tmp;
        gray.convertTo(tmp, CV_8U);
        gray = tmp;
    }
    return gray;
}

PreviewRaster make_preview(const cv::Mat& raster, int max_dim) {
    const int w = raster.cols;
    const int h = raster.rows;
    const double scale = std::min(1.0, static_cast<double>(max_dim) / std::max({w, h, 1}));

    cv::Mat gray = to_gray_u8(raster);
    cv::Mat small;
    if (scale < 1.0) {
        const int pw = std::max(1, static_cast<int>(std::lround(w * scale)));
        const int ph = std::max(1, static_cast<int>(std::lround(h * scale)));
        cv::resize(gray, small, cv::Size(pw, ph), 0, 0, cv::INTER_AREA);
    } else {
        small = gray;
    }

    cv::Mat small_f;
    small.convertTo(small_f, CV_32F);

    PreviewRaster preview;
    preview.scale = scale;
    preview.pixels.resize(small_f.rows, small_f.cols);
    for (int y = 0; y < small_f.rows; ++y) {
        std::memcpy(preview.pixels.data() + static_cast<size_t>(y) * small_f.cols,
                    small_f.ptr<float>(y),
                    static_cast<size_t>(small_f.cols) * sizeof(float));
    }
    return preview;
}

std::string output_extension(const config::OutputConfig& cfg) {
    return cfg.format == "tiff" ? ".tiff" : ".png";
}

void write_raster_with_dpi(const fs::path& path, const cv::Mat& raster, double dpi,
                           const config::OutputConfig& cfg) {
    if (raster.empty() || raster.channels() == 2) {
        throw OutputError("Nothing to encode for " + path.string());
    }
    cv::Mat pixels = raster;
    if (pixels.depth() != CV_8U) {
        raster.convertTo(pixels, CV_8U);
    }
    if (!pixels.isContinuous()) {
        pixels = pixels.clone();
    }

    initialize_codecs();
    Magick::Blob blob;
    try {
        Magick::Image image(static_cast<size_t>(pixels.cols), static_cast<size_t>(pixels.rows),
                            channel_map(pixels.channels()), Magick::CharPixel, pixels.data);
        image.quiet(true);
        image.resolutionUnits(Magick::PixelsPerInchResolution);
        image.density(Magick::Point(dpi, dpi));
        if (cfg.format == "tiff") {
            image.magick("TIFF");
            image.compressType(Magick::LZWCompression);
        } else {
            image.magick("PNG");
            // tens digit is the zlib level, 5 selects adaptive filtering
            image.quality(static_cast<size_t>(cfg.png_compression) * 10 + 5);
        }
        image.write(&blob);
    } catch (const Magick::Exception& e) {
        throw OutputError("Encoding failed for " + path.string() + ": " + e.what());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw OutputError("Cannot create file: " + path.string());
    }
    out.write(static_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.length()));
    if (!out) {
        throw OutputError("Cannot write file: " + path.string());
    }
}

} // namespace page_norm::io
