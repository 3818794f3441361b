#include "page_norm/image/background.hpp"

#include <algorithm>
#include <cmath>

namespace page_norm::image {

int border_band_px(int width, int height, const config::BackgroundConfig& cfg) {
    const double band = std::round(std::min(width, height) * static_cast<double>(cfg.border_sample_ratio));
    return std::max(1, static_cast<int>(band));
}

BorderStats compute_border_stats(const Matrix2Df& img, const config::BackgroundConfig& cfg) {
    const int h = static_cast<int>(img.rows());
    const int w = static_cast<int>(img.cols());
    const int band = border_band_px(w, h, cfg);

    double sum = 0.0;
    double sum_sq = 0.0;
    long long count = 0;
    auto sample = [&](int x, int y) {
        const double v = img(y, x);
        sum += v;
        sum_sq += v * v;
        ++count;
    };

    // Top and bottom bands span the full width.
    for (int x = 0; x < w; ++x) {
        for (int y = 0; y < std::min(band, h); ++y) sample(x, y);
        for (int y = std::max(band, h - band); y < h; ++y) sample(x, y);
    }
    for (int y = band; y < h - band; ++y) {
        for (int x = 0; x < std::min(band, w); ++x) sample(x, y);
        for (int x = std::max(band, w - band); x < w; ++x) sample(x, y);
    }

    BorderStats stats;
    if (count > 0) {
        stats.mean = sum / static_cast<double>(count);
        stats.std = std::sqrt(std::max(0.0, sum_sq / static_cast<double>(count) - stats.mean * stats.mean));
    }
    return stats;
}

double intensity_threshold(const BorderStats& stats, const config::BackgroundConfig& cfg) {
    const double by_std = stats.mean - stats.std * cfg.intensity_std_factor;
    const double by_offset = stats.mean - cfg.intensity_min_offset;
    return std::max(0.0, std::min(by_std, by_offset));
}

double edge_threshold(const GradientField& g, const config::BoundsConfig& cfg) {
    const MeanStd s = sampled_magnitude_stats(g, 2);
    return std::max(static_cast<double>(cfg.edge_threshold_floor),
                    s.mean + s.std * cfg.edge_threshold_scale);
}

} // namespace page_norm::image
