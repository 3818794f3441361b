#include "page_norm/image/deskew.hpp"

#include <algorithm>
#include <cmath>

namespace page_norm::image {

int angle_to_bucket(double angle_deg) {
    double a = angle_deg;
    if (a > 90.0) a -= 180.0;
    if (a < -90.0) a += 180.0;
    // Horizontal strokes have vertical gradients; fold them onto the same axis.
    if (a > 45.0) a -= 90.0;
    else if (a < -45.0) a += 90.0;
    const int bucket = static_cast<int>(std::lround(a + 90.0));
    return std::clamp(bucket, 0, kSkewHistogramBuckets - 1);
}

VectorXd gradient_orientation_histogram(const GradientField& g, const config::DeskewConfig& cfg) {
    VectorXd hist = VectorXd::Zero(kSkewHistogramBuckets);
    const int h = static_cast<int>(g.magnitude.rows());
    const int w = static_cast<int>(g.magnitude.cols());
    const double noise_floor = cfg.gradient_noise_floor;

    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            const double m = g.magnitude(y, x);
            if (m < noise_floor) continue;
            hist[angle_to_bucket(g.angle_deg(y, x))] += m;
        }
    }
    return hist;
}

SkewEstimate skew_from_histogram(const VectorXd& hist, int width, int height,
                                 const config::DeskewConfig& cfg) {
    int best_bucket = 90;
    double best_val = 0.0;
    for (int i = 0; i < hist.size(); ++i) {
        if (hist[i] > best_val) {
            best_val = hist[i];
            best_bucket = i;
        }
    }

    const int lo = std::max(0, best_bucket - cfg.histogram_window);
    const int hi = std::min(kSkewHistogramBuckets - 1, best_bucket + cfg.histogram_window);
    double num = 0.0;
    double den = 0.0;
    for (int i = lo; i <= hi; ++i) {
        num += static_cast<double>(i - 90) * hist[i];
        den += hist[i];
    }

    const double angle = den > 0.0 ? num / den : 0.0;
    const double max_skew = cfg.max_skew_degrees;
    const double norm = static_cast<double>(width) * static_cast<double>(height) *
                        cfg.confidence_scale;

    SkewEstimate out;
    out.angle_deg = std::clamp(angle, -max_skew, max_skew);
    out.confidence = norm > 0.0 ? std::min(1.0, best_val / norm) : 0.0;
    return out;
}

SkewEstimate estimate_skew(const PreviewRaster& preview, const config::DeskewConfig& cfg) {
    if (preview.width() < 3 || preview.height() < 3) {
        return {};
    }
    const GradientField g = compute_gradients(preview.pixels);
    const VectorXd hist = gradient_orientation_histogram(g, cfg);
    return skew_from_histogram(hist, preview.width(), preview.height(), cfg);
}

} // namespace page_norm::image
