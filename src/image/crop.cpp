#include "page_norm/image/crop.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/image/processing.hpp"

#include <algorithm>
#include <cmath>

namespace page_norm::image {

Box rescale_box(const Box& preview_box, int preview_w, int preview_h, int full_w, int full_h) {
    if (preview_w == full_w && preview_h == full_h) {
        return preview_box;
    }

    const double sx = static_cast<double>(full_w) / std::max(1, preview_w);
    const double sy = static_cast<double>(full_h) / std::max(1, preview_h);
    constexpr double kEps = 1e-9;

    Box out;
    out.left = std::clamp(static_cast<int>(std::floor(preview_box.left * sx)), 0, full_w - 1);
    out.top = std::clamp(static_cast<int>(std::floor(preview_box.top * sy)), 0, full_h - 1);
    out.right = std::clamp(static_cast<int>(std::ceil((preview_box.right + 1) * sx - kEps)) - 1,
                           out.left, full_w - 1);
    out.bottom = std::clamp(static_cast<int>(std::ceil((preview_box.bottom + 1) * sy - kEps)) - 1,
                            out.top, full_h - 1);
    return out;
}

cv::Mat compose_crop(const cv::Mat& raster, double skew_deg, const Box& crop) {
    if (!crop.within(raster.cols, raster.rows)) {
        throw ComputationError("crop box outside raster extents");
    }
    cv::Mat rotated = deskew_raster(raster, skew_deg);
    const cv::Rect roi(crop.left, crop.top, crop.width(), crop.height());
    return rotated(roi).clone();
}

} // namespace page_norm::image
