#include "page_norm/core/errors.hpp"
#include "page_norm/image/bounds.hpp"
#include "page_norm/image/crop.hpp"
#include "page_norm/pipeline/normalize_page.hpp"

#include "test_support.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using page_norm::Box;
using page_norm::Matrix2Df;
using page_norm::PreviewRaster;
using page_norm::ShadowDetection;
using page_norm::ShadowSide;
using page_norm::config::Config;
using namespace page_norm::image;

TEST_CASE("projection_box_requires_qualifying_row_and_column") {
  REQUIRE_FALSE(projection_box({0, 0, 0}, {5, 5}, 2, 2).has_value());
  REQUIRE_FALSE(projection_box({5, 5}, {1, 1, 1}, 2, 2).has_value());

  auto box = projection_box({0, 0, 3, 3, 0}, {0, 5, 5, 0}, 2, 2);
  REQUIRE(box.has_value());
  REQUIRE(*box == Box{1, 2, 2, 3});
}

TEST_CASE("line_limit_has_minimum") {
  REQUIRE(line_limit(1000, 0.008f, 2) == 8);
  REQUIRE(line_limit(100, 0.008f, 2) == 2);
}

TEST_CASE("clamp_box_keeps_nonempty_box_inside_frame") {
  REQUIRE(clamp_box({-5, -5, 500, 500}, 100, 80) == Box{0, 0, 99, 79});
  REQUIRE(clamp_box({99, 79, 99, 79}, 100, 80) == Box{98, 78, 99, 79});
  REQUIRE(clamp_box({40, 30, 10, 5}, 100, 80) == Box{40, 30, 41, 31});
}

TEST_CASE("expand_box_and_padding") {
  REQUIRE(expand_box({10, 10, 20, 20}, 5, 25, 30) == Box{5, 5, 24, 25});
  page_norm::config::BoundsConfig cfg;
  REQUIRE(adaptive_padding(100, 100, cfg) == 6);
  REQUIRE(adaptive_padding(5000, 4000, cfg) == 8);
}

TEST_CASE("rescale_box_maps_preview_to_full_resolution") {
  REQUIRE(rescale_box({1, 2, 3, 4}, 10, 10, 10, 10) == Box{1, 2, 3, 4});
  REQUIRE(rescale_box({0, 0, 9, 9}, 10, 10, 20, 20) == Box{0, 0, 19, 19});
  REQUIRE(rescale_box({2, 3, 5, 6}, 10, 10, 20, 20) == Box{4, 6, 11, 13});
}

TEST_CASE("compose_crop_rejects_out_of_range_box") {
  cv::Mat raster(40, 30, CV_8UC1, cv::Scalar(255));
  REQUIRE_THROWS_AS(compose_crop(raster, 0.0, {0, 0, 30, 39}), page_norm::ComputationError);
  cv::Mat out = compose_crop(raster, 0.0, {5, 6, 14, 25});
  REQUIRE(out.cols == 10);
  REQUIRE(out.rows == 20);
}

TEST_CASE("blank_page_keeps_full_frame") {
  Config cfg;
  PreviewRaster preview;
  preview.pixels = Matrix2Df::Constant(300, 200, 255.0f);
  preview.scale = 1.0;

  auto a = page_norm::pipeline::analyze_preview(preview, cfg);
  REQUIRE(a.skew.angle_deg == 0.0);
  REQUIRE_FALSE(a.bounds.content_found);
  REQUIRE_FALSE(a.bounds.intensity_box.has_value());
  REQUIRE_FALSE(a.bounds.edge_box.has_value());
  REQUIRE(a.bounds.mask_box == Box{6, 6, 193, 293});
  REQUIRE(a.bounds.expanded_box == Box{0, 0, 199, 299});
  REQUIRE(a.bounds.mask_coverage == Catch::Approx(1.0));
}

TEST_CASE("bounds_stages_run_in_order") {
  Config cfg;
  PreviewRaster preview;
  preview.pixels = Matrix2Df::Constant(300, 200, 255.0f);
  preview.scale = 1.0;
  auto a = page_norm::pipeline::analyze_preview(preview, cfg);
  const std::vector<std::string> expected = {"intensity_mask", "edge_mask", "union",
                                             "shadow_trim", "clamp", "pad_expand"};
  REQUIRE(a.bounds.applied_stages == expected);
}

TEST_CASE("bounds_enclose_dark_content_block") {
  Config cfg;
  cv::Mat page(300, 200, CV_8UC1, cv::Scalar(255));
  cv::rectangle(page, cv::Point(50, 60), cv::Point(149, 239), cv::Scalar(0), cv::FILLED);
  auto preview = page_norm_test::to_preview(page);

  auto a = page_norm::pipeline::analyze_preview(preview, cfg);
  REQUIRE(std::fabs(a.skew.angle_deg) < 0.5);
  REQUIRE(a.bounds.content_found);
  REQUIRE(a.bounds.intensity_box.has_value());
  REQUIRE(*a.bounds.intensity_box == Box{50, 60, 149, 239});

  const Box &mask = a.bounds.mask_box;
  REQUIRE(mask.left >= 47);
  REQUIRE(mask.left <= 50);
  REQUIRE(mask.top >= 57);
  REQUIRE(mask.top <= 60);
  REQUIRE(mask.right >= 149);
  REQUIRE(mask.right <= 152);
  REQUIRE(mask.bottom >= 239);
  REQUIRE(mask.bottom <= 242);

  REQUIRE(a.bounds.padding_px == 6);
  REQUIRE(a.bounds.expanded_box == expand_box(mask, 6, 200, 300));
  const double expected = static_cast<double>(a.bounds.expanded_box.area()) / (200.0 * 300.0);
  REQUIRE(a.bounds.mask_coverage == Catch::Approx(expected));
  REQUIRE(a.bounds.mask_coverage < 0.5);
}

TEST_CASE("shadow_trim_applies_only_above_confidence") {
  Config cfg;
  Matrix2Df img = Matrix2Df::Constant(100, 100, 255.0f);
  GradientField g = compute_gradients(img);

  ShadowDetection shadow;
  shadow.present = true;
  shadow.side = ShadowSide::LEFT;
  shadow.width_px = 20;
  shadow.confidence = 0.5;

  BoundsRecord in;
  in.box = {10, 10, 90, 90};

  BoundsContext strong{img, g, {}, shadow, cfg};
  auto out = shadow_trim_stage(strong, in);
  REQUIRE(out.box.left == 25);
  REQUIRE(out.box.right == 90);
  REQUIRE(out.shadow_trim_px == 15);

  shadow.side = ShadowSide::RIGHT;
  BoundsContext right{img, g, {}, shadow, cfg};
  REQUIRE(shadow_trim_stage(right, in).box.right == 75);

  shadow.confidence = 0.2;
  BoundsContext weak{img, g, {}, shadow, cfg};
  REQUIRE(shadow_trim_stage(weak, in).box == in.box);
}

TEST_CASE("shadow_trim_never_crosses_a_narrow_union") {
  Config cfg;
  Matrix2Df img = Matrix2Df::Constant(400, 1000, 255.0f);
  GradientField g = compute_gradients(img);

  ShadowDetection shadow;
  shadow.present = true;
  shadow.side = ShadowSide::LEFT;
  shadow.width_px = 40;
  shadow.confidence = 0.4;

  const Box united{100, 50, 120, 300};
  BoundsRecord in;
  in.box = united;

  BoundsContext ctx{img, g, {}, shadow, cfg};
  auto trimmed = shadow_trim_stage(ctx, in);
  REQUIRE(trimmed.shadow_trim_px == 19);
  REQUIRE(trimmed.box.left == 119);
  REQUIRE(trimmed.box.left < trimmed.box.right);

  auto clamped = clamp_stage(ctx, trimmed);
  REQUIRE(clamped.mask_box == Box{119, 50, 120, 300});
  REQUIRE(clamped.mask_box.left >= united.left);
  REQUIRE(clamped.mask_box.right <= united.right);

  shadow.side = ShadowSide::RIGHT;
  BoundsContext right{img, g, {}, shadow, cfg};
  auto right_trimmed = shadow_trim_stage(right, in);
  REQUIRE(right_trimmed.box == Box{100, 50, 101, 300});

  in.box = {100, 50, 100, 300};
  REQUIRE(shadow_trim_stage(right, in).shadow_trim_px == 0);
}

TEST_CASE("bounds_reject_tiny_preview") {
  Config cfg;
  Matrix2Df img = Matrix2Df::Constant(2, 2, 255.0f);
  GradientField g = compute_gradients(img);
  BoundsContext ctx{img, g, {}, {}, cfg};
  REQUIRE_THROWS_AS(estimate_bounds(ctx), page_norm::ComputationError);

  PreviewRaster preview;
  preview.pixels = img;
  REQUIRE_THROWS_AS(page_norm::pipeline::analyze_preview(preview, cfg),
                    page_norm::ComputationError);
}
