#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace page_norm {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

// Inclusive pixel box: [left, right] x [top, bottom]
struct Box {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left + 1; }
    int height() const { return bottom - top + 1; }
    long long area() const {
        if (right < left || bottom < top) return 0;
        return static_cast<long long>(width()) * static_cast<long long>(height());
    }
    bool within(int w, int h) const {
        return left >= 0 && top >= 0 && right < w && bottom < h &&
               left <= right && top <= bottom;
    }
};

inline bool operator==(const Box& a, const Box& b) {
    return a.left == b.left && a.top == b.top && a.right == b.right && a.bottom == b.bottom;
}

inline bool operator!=(const Box& a, const Box& b) { return !(a == b); }

inline Box union_box(const Box& a, const Box& b) {
    return {std::min(a.left, b.left), std::min(a.top, b.top),
            std::max(a.right, b.right), std::max(a.bottom, b.bottom)};
}

// DPI provenance
enum class DpiSource {
    METADATA,
    INFERRED,
    FALLBACK
};

inline std::string dpi_source_to_string(DpiSource source) {
    switch (source) {
        case DpiSource::METADATA: return "metadata";
        case DpiSource::INFERRED: return "inferred";
        case DpiSource::FALLBACK: return "fallback";
        default: return "fallback";
    }
}

enum class ShadowSide {
    NONE,
    LEFT,
    RIGHT,
    TOP,
    BOTTOM
};

inline std::string shadow_side_to_string(ShadowSide side) {
    switch (side) {
        case ShadowSide::LEFT: return "left";
        case ShadowSide::RIGHT: return "right";
        case ShadowSide::TOP: return "top";
        case ShadowSide::BOTTOM: return "bottom";
        default: return "none";
    }
}

// Page identity as produced by corpus discovery
struct PageSource {
    std::string id;
    std::string filename;
    fs::path path;
    std::string checksum;
    int width_px = 0;
    int height_px = 0;
    std::optional<double> density;
};

// Rough bounds supplied upstream, read-only here
struct BoundsEstimate {
    std::string page_id;
    int width_px = 0;
    int height_px = 0;
    double bleed_px = 0.0;
    double trim_px = 0.0;
    Box page_bounds;
    Box content_bounds;
};

// Grayscale analysis buffer, intensities 0..255
struct PreviewRaster {
    Matrix2Df pixels;
    double scale = 1.0;

    int width() const { return static_cast<int>(pixels.cols()); }
    int height() const { return static_cast<int>(pixels.rows()); }
};

struct ShadowDetection {
    bool present = false;
    ShadowSide side = ShadowSide::NONE;
    int width_px = 0;
    double confidence = 0.0;
    double darkness = 0.0;
};

struct PhysicalSize {
    double width_mm = 0.0;
    double height_mm = 0.0;
    double dpi = 0.0;
    DpiSource source = DpiSource::FALLBACK;
};

struct SkewEstimate {
    double angle_deg = 0.0;
    double confidence = 0.0;
};

struct BorderStats {
    double mean = 255.0;
    double std = 0.0;
};

struct NormalizationStats {
    double background_mean = 0.0;
    double background_std = 0.0;
    double mask_coverage = 0.0;
    double skew_confidence = 0.0;
    double shadow_score = 0.0;
};

struct NormalizationResult {
    std::string page_id;
    fs::path normalized_path;
    Box crop_box;          // full-resolution pixels, after padding
    Box mask_box;          // full-resolution pixels, before padding
    int source_width_px = 0;
    int source_height_px = 0;
    double width_mm = 0.0;
    double height_mm = 0.0;
    double dpi = 0.0;
    DpiSource dpi_source = DpiSource::FALLBACK;
    double trim_mm = 0.0;
    double bleed_mm = 0.0;
    double skew_angle = 0.0;
    ShadowDetection shadow;
    NormalizationStats stats;
    double processing_ms = 0.0;
};

// Structured record of a page that did not produce a result
struct PageFailure {
    std::string page_id;
    std::string phase;
    std::string kind;
    std::string message;
};

// Run phase enumeration
enum class Phase {
    SCAN_INPUT = 0,
    LOAD_ESTIMATES = 1,
    NORMALIZATION = 2,
    SIDECARS = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::LOAD_ESTIMATES: return "LOAD_ESTIMATES";
        case Phase::NORMALIZATION: return "NORMALIZATION";
        case Phase::SIDECARS: return "SIDECARS";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace page_norm
