#include "page_norm/image/bounds.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/image/background.hpp"

#include <algorithm>
#include <cmath>

namespace page_norm::image {

std::optional<Box> projection_box(const std::vector<int>& row_counts,
                                  const std::vector<int>& col_counts,
                                  int row_limit, int col_limit) {
    const int h = static_cast<int>(row_counts.size());
    const int w = static_cast<int>(col_counts.size());

    int top = 0;
    while (top < h && row_counts[top] < row_limit) ++top;
    int left = 0;
    while (left < w && col_counts[left] < col_limit) ++left;
    if (top >= h || left >= w) return std::nullopt;

    int bottom = h - 1;
    while (bottom > top && row_counts[bottom] < row_limit) --bottom;
    int right = w - 1;
    while (right > left && col_counts[right] < col_limit) --right;

    return Box{left, top, right, bottom};
}

int line_limit(int length, float fraction, int min_count) {
    return std::max(min_count, static_cast<int>(std::floor(length * static_cast<double>(fraction))));
}

Box clamp_box(const Box& b, int width, int height) {
    Box out;
    out.left = std::max(0, std::min(width - 2, b.left));
    out.top = std::max(0, std::min(height - 2, b.top));
    out.right = std::max(out.left + 1, std::min(width - 1, b.right));
    out.bottom = std::max(out.top + 1, std::min(height - 1, b.bottom));
    return out;
}

Box expand_box(const Box& b, int padding, int width, int height) {
    return {std::max(0, b.left - padding), std::max(0, b.top - padding),
            std::min(width - 1, b.right + padding), std::min(height - 1, b.bottom + padding)};
}

int adaptive_padding(int width, int height, const config::BoundsConfig& cfg) {
    const int scaled = static_cast<int>(std::round(std::min(width, height) * static_cast<double>(cfg.padding_ratio)));
    return std::max(cfg.min_padding_px, scaled);
}

BoundsRecord intensity_mask_stage(const BoundsContext& ctx, const BoundsRecord& in) {
    BoundsRecord out = in;
    const int w = ctx.width();
    const int h = ctx.height();
    const double threshold = intensity_threshold(ctx.border, ctx.cfg.background);

    std::vector<int> rows(static_cast<size_t>(h), 0);
    std::vector<int> cols(static_cast<size_t>(w), 0);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (ctx.preview(y, x) < threshold) {
                ++rows[static_cast<size_t>(y)];
                ++cols[static_cast<size_t>(x)];
            }
        }
    }

    const auto& b = ctx.cfg.bounds;
    out.intensity_threshold = threshold;
    out.intensity_box = projection_box(rows, cols,
                                       line_limit(w, b.intensity_line_fraction, b.min_line_count),
                                       line_limit(h, b.intensity_line_fraction, b.min_line_count));
    out.intensity_coverage = out.intensity_box
        ? static_cast<double>(out.intensity_box->area()) / (static_cast<double>(w) * h)
        : 0.0;
    return out;
}

BoundsRecord edge_mask_stage(const BoundsContext& ctx, const BoundsRecord& in) {
    BoundsRecord out = in;
    const int w = ctx.width();
    const int h = ctx.height();
    const double threshold = edge_threshold(ctx.gradients, ctx.cfg.bounds);

    std::vector<int> rows(static_cast<size_t>(h), 0);
    std::vector<int> cols(static_cast<size_t>(w), 0);
    for (int y = 1; y < h - 1; ++y) {
        for (int x = 1; x < w - 1; ++x) {
            if (ctx.gradients.magnitude(y, x) > threshold) {
                ++rows[static_cast<size_t>(y)];
                ++cols[static_cast<size_t>(x)];
            }
        }
    }

    const auto& b = ctx.cfg.bounds;
    out.edge_threshold = threshold;
    out.edge_box = projection_box(rows, cols,
                                  line_limit(w, b.edge_line_fraction, b.min_line_count),
                                  line_limit(h, b.edge_line_fraction, b.min_line_count));
    return out;
}

BoundsRecord union_stage(const BoundsContext& ctx, const BoundsRecord& in) {
    BoundsRecord out = in;
    if (in.intensity_box && in.edge_box) {
        out.box = union_box(*in.intensity_box, *in.edge_box);
    } else if (in.intensity_box) {
        out.box = *in.intensity_box;
    } else if (in.edge_box) {
        out.box = *in.edge_box;
    } else {
        // Blank page: keep the whole frame minus the padding pad_expand adds back.
        const int pad = adaptive_padding(ctx.width(), ctx.height(), ctx.cfg.bounds);
        out.box = {pad, pad, ctx.width() - 1 - pad, ctx.height() - 1 - pad};
        out.content_found = false;
        return out;
    }
    out.content_found = true;
    return out;
}

BoundsRecord shadow_trim_stage(const BoundsContext& ctx, const BoundsRecord& in) {
    BoundsRecord out = in;
    const auto& shadow = ctx.shadow;
    if (!shadow.present || shadow.confidence <= ctx.cfg.shadow.trim_confidence) {
        return out;
    }

    int trim = static_cast<int>(std::round(shadow.width_px * static_cast<double>(ctx.cfg.shadow.trim_fraction)));
    // keep at least one column of the union
    trim = std::clamp(trim, 0, std::max(0, out.box.right - out.box.left - 1));
    if (shadow.side == ShadowSide::LEFT) {
        out.box.left += trim;
        out.shadow_trim_px = trim;
    } else if (shadow.side == ShadowSide::RIGHT) {
        out.box.right -= trim;
        out.shadow_trim_px = trim;
    }
    return out;
}

BoundsRecord clamp_stage(const BoundsContext& ctx, const BoundsRecord& in) {
    BoundsRecord out = in;
    out.box = clamp_box(in.box, ctx.width(), ctx.height());
    out.mask_box = out.box;
    return out;
}

BoundsRecord pad_expand_stage(const BoundsContext& ctx, const BoundsRecord& in) {
    BoundsRecord out = in;
    out.padding_px = adaptive_padding(ctx.width(), ctx.height(), ctx.cfg.bounds);
    out.expanded_box = expand_box(in.mask_box, out.padding_px, ctx.width(), ctx.height());
    out.box = out.expanded_box;
    const double frame_area = static_cast<double>(ctx.width()) * ctx.height();
    out.mask_coverage = std::clamp(static_cast<double>(out.expanded_box.area()) / frame_area, 0.0, 1.0);
    return out;
}

const std::vector<BoundsStage>& default_bounds_stages() {
    static const std::vector<BoundsStage> stages = {
        {"intensity_mask", intensity_mask_stage},
        {"edge_mask", edge_mask_stage},
        {"union", union_stage},
        {"shadow_trim", shadow_trim_stage},
        {"clamp", clamp_stage},
        {"pad_expand", pad_expand_stage},
    };
    return stages;
}

BoundsRecord run_bounds_stages(const BoundsContext& ctx, const std::vector<BoundsStage>& stages) {
    BoundsRecord record;
    for (const auto& stage : stages) {
        record = stage.apply(ctx, record);
        record.applied_stages.push_back(stage.name);
    }
    return record;
}

BoundsRecord estimate_bounds(const BoundsContext& ctx) {
    if (ctx.width() < 3 || ctx.height() < 3) {
        throw ComputationError("preview too small for bounds estimation: " +
                               std::to_string(ctx.width()) + "x" + std::to_string(ctx.height()));
    }

    BoundsRecord record = run_bounds_stages(ctx, default_bounds_stages());
    if (record.expanded_box.area() <= 0 || !record.expanded_box.within(ctx.width(), ctx.height())) {
        throw ComputationError("degenerate crop box after clamping");
    }
    return record;
}

} // namespace page_norm::image
