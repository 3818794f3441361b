#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"
#include "page_norm/image/processing.hpp"

namespace page_norm::image {

// Band width along every edge: max(1, round(min(w, h) * ratio)).
int border_band_px(int width, int height, const config::BackgroundConfig& cfg);

// Mean/std over the four edge bands; corners are sampled once.
BorderStats compute_border_stats(const Matrix2Df& img, const config::BackgroundConfig& cfg);

// max(0, min(mean - factor * std, mean - offset))
double intensity_threshold(const BorderStats& stats, const config::BackgroundConfig& cfg);

// max(floor, mean + scale * std) over sampled gradient magnitudes.
double edge_threshold(const GradientField& g, const config::BoundsConfig& cfg);

} // namespace page_norm::image
