#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"
#include "page_norm/image/processing.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace page_norm::image {

// Read-only inputs shared by every bounds stage. All geometry is in
// deskewed-preview pixels.
struct BoundsContext {
    const Matrix2Df& preview;
    const GradientField& gradients;
    BorderStats border;
    ShadowDetection shadow;
    const config::Config& cfg;

    int width() const { return static_cast<int>(preview.cols()); }
    int height() const { return static_cast<int>(preview.rows()); }
};

// Box plus the measurements each stage leaves behind.
struct BoundsRecord {
    std::optional<Box> intensity_box;
    double intensity_threshold = 0.0;
    double intensity_coverage = 0.0;

    std::optional<Box> edge_box;
    double edge_threshold = 0.0;

    Box box;                // working box of the current stage
    bool content_found = false;
    int shadow_trim_px = 0;
    int padding_px = 0;

    Box mask_box;           // after clamp, before padding
    Box expanded_box;       // after padding
    double mask_coverage = 0.0;

    std::vector<std::string> applied_stages;
};

using BoundsStageFn = std::function<BoundsRecord(const BoundsContext&, const BoundsRecord&)>;

struct BoundsStage {
    std::string name;
    BoundsStageFn apply;
};

// Inward scan from each edge until a row/column count reaches its limit.
// nullopt when no row or no column qualifies.
std::optional<Box> projection_box(const std::vector<int>& row_counts,
                                  const std::vector<int>& col_counts,
                                  int row_limit, int col_limit);

int line_limit(int length, float fraction, int min_count);

// left in [0, w-2], top in [0, h-2], right in [left+1, w-1], bottom in [top+1, h-1]
Box clamp_box(const Box& b, int width, int height);

Box expand_box(const Box& b, int padding, int width, int height);

// max(min_padding_px, round(min(w, h) * padding_ratio))
int adaptive_padding(int width, int height, const config::BoundsConfig& cfg);

BoundsRecord intensity_mask_stage(const BoundsContext& ctx, const BoundsRecord& in);
BoundsRecord edge_mask_stage(const BoundsContext& ctx, const BoundsRecord& in);
BoundsRecord union_stage(const BoundsContext& ctx, const BoundsRecord& in);
BoundsRecord shadow_trim_stage(const BoundsContext& ctx, const BoundsRecord& in);
BoundsRecord clamp_stage(const BoundsContext& ctx, const BoundsRecord& in);
BoundsRecord pad_expand_stage(const BoundsContext& ctx, const BoundsRecord& in);

// intensity_mask, edge_mask, union, shadow_trim, clamp, pad_expand
const std::vector<BoundsStage>& default_bounds_stages();

BoundsRecord run_bounds_stages(const BoundsContext& ctx, const std::vector<BoundsStage>& stages);

// Full chain. Throws ComputationError for previews under 3x3 pixels.
BoundsRecord estimate_bounds(const BoundsContext& ctx);

} // namespace page_norm::image
