#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"

namespace page_norm::image {

int shadow_strip_px(int width, const config::ShadowConfig& cfg);

// Left/right margin strips against the global mean. Top and bottom are not
// examined.
ShadowDetection detect_shadow(const Matrix2Df& img, const config::ShadowConfig& cfg);

} // namespace page_norm::image
