#include "page_norm/image/deskew.hpp"
#include "page_norm/image/processing.hpp"

#include "test_support.hpp"

#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using page_norm::VectorXd;
using page_norm::config::DeskewConfig;
using page_norm::image::angle_to_bucket;
using page_norm::image::estimate_skew;
using page_norm::image::kSkewHistogramBuckets;
using page_norm::image::skew_from_histogram;

TEST_CASE("angle_to_bucket_folds_both_stroke_axes") {
  REQUIRE(angle_to_bucket(0.0) == 90);
  REQUIRE(angle_to_bucket(90.0) == 90);
  REQUIRE(angle_to_bucket(-90.0) == 90);
  REQUIRE(angle_to_bucket(180.0) == 90);
  REQUIRE(angle_to_bucket(-87.0) == 93);
  REQUIRE(angle_to_bucket(93.0) == 93);
  REQUIRE(angle_to_bucket(3.0) == 93);
  REQUIRE(angle_to_bucket(30.0) == 120);
}

TEST_CASE("skew_from_empty_histogram_is_zero") {
  DeskewConfig cfg;
  VectorXd hist = VectorXd::Zero(kSkewHistogramBuckets);
  auto s = skew_from_histogram(hist, 10, 10, cfg);
  REQUIRE(s.angle_deg == 0.0);
  REQUIRE(s.confidence == 0.0);
}

TEST_CASE("skew_from_histogram_clamps_and_scores") {
  DeskewConfig cfg;
  VectorXd hist = VectorXd::Zero(kSkewHistogramBuckets);
  hist[120] = 100.0;
  auto s = skew_from_histogram(hist, 10, 10, cfg);
  REQUIRE(s.angle_deg == Catch::Approx(cfg.max_skew_degrees));
  REQUIRE(s.confidence == Catch::Approx(100.0 / (10.0 * 10.0 * cfg.confidence_scale)));

  hist = VectorXd::Zero(kSkewHistogramBuckets);
  hist[92] = 30.0;
  hist[93] = 60.0;
  hist[94] = 30.0;
  s = skew_from_histogram(hist, 10, 10, cfg);
  REQUIRE(s.angle_deg == Catch::Approx(3.0));
}

TEST_CASE("estimate_skew_recovers_counter_clockwise_rotation") {
  DeskewConfig cfg;
  cv::Mat page = page_norm_test::text_page(600, 800, 80, 100);
  auto preview = page_norm_test::to_preview(page_norm_test::rotate_ccw(page, 3.0));

  auto s = estimate_skew(preview, cfg);
  REQUIRE(s.angle_deg == Catch::Approx(3.0).margin(1.0));
  REQUIRE(s.confidence > 0.0);

  auto mirrored = page_norm_test::to_preview(page_norm_test::rotate_ccw(page, -3.0));
  REQUIRE(estimate_skew(mirrored, cfg).angle_deg == Catch::Approx(-3.0).margin(1.0));
}

TEST_CASE("estimate_skew_is_deterministic") {
  DeskewConfig cfg;
  cv::Mat page = page_norm_test::rotate_ccw(page_norm_test::text_page(400, 500, 40, 60), 2.0);
  auto preview = page_norm_test::to_preview(page);
  auto a = estimate_skew(preview, cfg);
  auto b = estimate_skew(preview, cfg);
  REQUIRE(a.angle_deg == b.angle_deg);
  REQUIRE(a.confidence == b.confidence);
}

TEST_CASE("deskew_preview_straightens_rotated_bars") {
  DeskewConfig cfg;
  cv::Mat page = page_norm_test::text_page(600, 800, 80, 100);
  auto preview = page_norm_test::to_preview(page_norm_test::rotate_ccw(page, 3.0));
  auto s = estimate_skew(preview, cfg);

  page_norm::PreviewRaster corrected;
  corrected.pixels = page_norm::image::deskew_preview(preview.pixels, s.angle_deg);
  corrected.scale = 1.0;
  REQUIRE(std::fabs(estimate_skew(corrected, cfg).angle_deg) < 1.0);
  REQUIRE(corrected.width() == preview.width());
  REQUIRE(corrected.height() == preview.height());
}

TEST_CASE("estimate_skew_tiny_preview_is_zero") {
  DeskewConfig cfg;
  page_norm::PreviewRaster tiny;
  tiny.pixels = page_norm::Matrix2Df::Constant(2, 2, 0.0f);
  auto s = estimate_skew(tiny, cfg);
  REQUIRE(s.angle_deg == 0.0);
  REQUIRE(s.confidence == 0.0);
}
