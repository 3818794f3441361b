#pragma once

#include "page_norm/core/types.hpp"

#include <opencv2/core.hpp>

namespace page_norm::image {

// Maps an inclusive preview box onto the full-resolution grid so that the
// result covers every source pixel the preview box covered.
Box rescale_box(const Box& preview_box, int preview_w, int preview_h, int full_w, int full_h);

// Deskews the full raster by skew_deg and cuts out crop (full-resolution pixels).
// Throws ComputationError when crop lies outside the raster.
cv::Mat compose_crop(const cv::Mat& raster, double skew_deg, const Box& crop);

} // namespace page_norm::image
