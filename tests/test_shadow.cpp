#include "page_norm/image/background.hpp"
#include "page_norm/image/shadow.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using page_norm::Matrix2Df;
using page_norm::ShadowSide;
using page_norm::config::BackgroundConfig;
using page_norm::config::ShadowConfig;
using page_norm::image::detect_shadow;

TEST_CASE("shadow_detected_on_dark_left_strip") {
  ShadowConfig cfg;
  Matrix2Df img = Matrix2Df::Constant(50, 1000, 255.0f);
  img.leftCols(40).setConstant(215.0f);

  auto s = detect_shadow(img, cfg);
  REQUIRE(s.present);
  REQUIRE(s.side == ShadowSide::LEFT);
  REQUIRE(s.width_px == 40);
  REQUIRE(s.darkness == Catch::Approx(38.4).margin(1e-3));
  REQUIRE(s.confidence == Catch::Approx(38.4 / 253.4).margin(1e-4));
}

TEST_CASE("shadow_detected_on_dark_right_strip") {
  ShadowConfig cfg;
  Matrix2Df img = Matrix2Df::Constant(50, 1000, 255.0f);
  img.rightCols(40).setConstant(200.0f);

  auto s = detect_shadow(img, cfg);
  REQUIRE(s.present);
  REQUIRE(s.side == ShadowSide::RIGHT);
}

TEST_CASE("no_shadow_on_uniform_page") {
  ShadowConfig cfg;
  Matrix2Df img = Matrix2Df::Constant(50, 1000, 240.0f);
  auto s = detect_shadow(img, cfg);
  REQUIRE_FALSE(s.present);
  REQUIRE(s.side == ShadowSide::NONE);
  REQUIRE(s.width_px == 0);
  REQUIRE(s.confidence == Catch::Approx(0.0).margin(1e-9));
}

TEST_CASE("faint_strip_below_required_delta") {
  ShadowConfig cfg;
  Matrix2Df img = Matrix2Df::Constant(50, 1000, 255.0f);
  img.leftCols(40).setConstant(245.0f);
  REQUIRE_FALSE(detect_shadow(img, cfg).present);
}

TEST_CASE("border_stats_and_intensity_threshold") {
  BackgroundConfig cfg;
  Matrix2Df img = Matrix2Df::Constant(100, 100, 250.0f);
  img.block(20, 20, 60, 60).setConstant(0.0f);

  auto stats = page_norm::image::compute_border_stats(img, cfg);
  REQUIRE(stats.mean == Catch::Approx(250.0));
  REQUIRE(stats.std == Catch::Approx(0.0).margin(1e-6));
  REQUIRE(page_norm::image::intensity_threshold(stats, cfg) == Catch::Approx(244.0));
}
