#include "page_norm/image/shadow.hpp"

#include <algorithm>
#include <cmath>

namespace page_norm::image {

int shadow_strip_px(int width, const config::ShadowConfig& cfg) {
    const int strip = static_cast<int>(std::round(width * static_cast<double>(cfg.strip_ratio)));
    return std::min(width, std::max(cfg.min_strip_px, strip));
}

ShadowDetection detect_shadow(const Matrix2Df& img, const config::ShadowConfig& cfg) {
    const int w = static_cast<int>(img.cols());
    ShadowDetection out;
    if (w == 0 || img.rows() == 0) return out;

    const int strip = shadow_strip_px(w, cfg);
    auto column_mean = [&](int x0, int x1) -> double {
        if (x1 <= x0) return 0.0;
        return static_cast<double>(img.middleCols(x0, x1 - x0).cast<double>().mean());
    };

    const double global_mean = column_mean(0, w);
    const double left_delta = global_mean - column_mean(0, strip);
    const double right_delta = global_mean - column_mean(w - strip, w);

    const bool is_left = left_delta > right_delta;
    const double delta = is_left ? left_delta : right_delta;
    const double required = std::max(static_cast<double>(cfg.min_delta), global_mean * cfg.delta_ratio);

    out.present = delta > required;
    out.side = out.present ? (is_left ? ShadowSide::LEFT : ShadowSide::RIGHT) : ShadowSide::NONE;
    out.width_px = out.present ? strip : 0;
    out.confidence = std::clamp(delta / std::max(1.0, global_mean), 0.0, 1.0);
    out.darkness = std::max(left_delta, right_delta);
    return out;
}

} // namespace page_norm::image
