#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"
#include "page_norm/image/processing.hpp"

namespace page_norm::image {

constexpr int kSkewHistogramBuckets = 181; // -90..+90 degrees

// Gradient angle folded onto the nearest image axis and mapped to a bucket.
// Bucket 90 is level.
int angle_to_bucket(double angle_deg);

VectorXd gradient_orientation_histogram(const GradientField& g, const config::DeskewConfig& cfg);

SkewEstimate skew_from_histogram(const VectorXd& hist, int width, int height,
                                 const config::DeskewConfig& cfg);

// Positive angles mean content rotated counter-clockwise on screen.
SkewEstimate estimate_skew(const PreviewRaster& preview, const config::DeskewConfig& cfg);

} // namespace page_norm::image
