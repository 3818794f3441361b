#include "page_norm/geometry/physical_size.hpp"
#include "page_norm/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace page_norm::geometry {

const std::vector<StandardPageSize>& standard_page_sizes() {
    static const std::vector<StandardPageSize> sizes = {
        {"A4", 210.0, 297.0},
        {"Letter", 216.0, 279.0},
        {"B5", 176.0, 250.0},
        {"A5", 148.0, 210.0},
        {"A3", 297.0, 420.0},
    };
    return sizes;
}

double px_to_mm(double px, double dpi) {
    return px / dpi * 25.4;
}

PhysicalSize infer_physical_size(int width_px, int height_px,
                                 std::optional<double> density, double fallback_dpi,
                                 const config::PhysicalSizeConfig& cfg) {
    if (!std::isfinite(fallback_dpi) || fallback_dpi <= 0.0) {
        throw ValidationError("fallback DPI must be positive, got " + std::to_string(fallback_dpi));
    }

    PhysicalSize out;

    if (density && *density > cfg.min_trusted_density) {
        out.width_mm = px_to_mm(width_px, *density);
        out.height_mm = px_to_mm(height_px, *density);
        out.dpi = *density;
        out.source = DpiSource::METADATA;
        return out;
    }

    const double ratio = static_cast<double>(width_px) / std::max(1, height_px);
    double best_score = std::numeric_limits<double>::infinity();
    double best_w = 0.0;
    double best_h = 0.0;

    // First strictly better candidate wins ties.
    for (const auto& size : standard_page_sizes()) {
        const double variants[2][2] = {{size.width_mm, size.height_mm},
                                       {size.height_mm, size.width_mm}};
        for (const auto& v : variants) {
            const double score = std::fabs(v[0] / v[1] - ratio);
            if (score < best_score) {
                best_score = score;
                best_w = v[0];
                best_h = v[1];
            }
        }
    }

    if (best_score < cfg.match_tolerance) {
        out.width_mm = best_w;
        out.height_mm = best_h;
        out.dpi = width_px / (best_w / 25.4);
        out.source = DpiSource::INFERRED;
        if (out.dpi > 0.0) return out;
    }

    out.width_mm = px_to_mm(width_px, fallback_dpi);
    out.height_mm = px_to_mm(height_px, fallback_dpi);
    out.dpi = fallback_dpi;
    out.source = DpiSource::FALLBACK;
    return out;
}

} // namespace page_norm::geometry
