#pragma once

#include "page_norm/core/types.hpp"

#include <opencv2/core.hpp>

namespace page_norm::image {

// Per-pixel 3x3 Sobel response. gy points up (image rows grow downward), so
// angle_deg = atan2(gy, gx) follows the usual counter-clockwise convention.
// Border rows/columns are not meaningful and are never read.
struct GradientField {
    Matrix2Df magnitude;
    Matrix2Df angle_deg;
};

struct MeanStd {
    double mean = 0.0;
    double std = 0.0;
};

cv::Mat eigen_to_cv(const Matrix2Df& m);
Matrix2Df cv_to_eigen(const cv::Mat& m);

GradientField compute_gradients(const Matrix2Df& img);

// Mean/std of interior magnitudes sampled on a step x step lattice.
MeanStd sampled_magnitude_stats(const GradientField& g, int step = 2);

// Rotates by -skew_deg about the centre so content skewed by skew_deg becomes
// level. Same canvas size; uncovered area is white.
Matrix2Df deskew_preview(const Matrix2Df& img, double skew_deg);
cv::Mat deskew_raster(const cv::Mat& raster, double skew_deg);

} // namespace page_norm::image
