#include "page_norm/core/errors.hpp"
#include "page_norm/geometry/physical_size.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using page_norm::DpiSource;
using page_norm::config::PhysicalSizeConfig;
using page_norm::geometry::infer_physical_size;

TEST_CASE("physical_size_prefers_metadata_density") {
  PhysicalSizeConfig cfg;
  auto s = infer_physical_size(2480, 3508, 300.0, 400.0, cfg);
  REQUIRE(s.source == DpiSource::METADATA);
  REQUIRE(s.dpi == Catch::Approx(300.0));
  REQUIRE(s.width_mm == Catch::Approx(2480.0 / 300.0 * 25.4));
  REQUIRE(s.height_mm == Catch::Approx(3508.0 / 300.0 * 25.4));
}

TEST_CASE("physical_size_ignores_untrusted_density") {
  PhysicalSizeConfig cfg;
  auto s = infer_physical_size(420, 594, 1.0, 300.0, cfg);
  REQUIRE(s.source == DpiSource::INFERRED);
}

TEST_CASE("physical_size_infers_a4_from_aspect_ratio") {
  PhysicalSizeConfig cfg;
  auto s = infer_physical_size(420, 594, std::nullopt, 300.0, cfg);
  REQUIRE(s.source == DpiSource::INFERRED);
  REQUIRE(s.width_mm == Catch::Approx(210.0));
  REQUIRE(s.height_mm == Catch::Approx(297.0));
  REQUIRE(s.dpi == Catch::Approx(50.8));
}

TEST_CASE("physical_size_matches_landscape_orientation") {
  PhysicalSizeConfig cfg;
  auto s = infer_physical_size(594, 420, std::nullopt, 300.0, cfg);
  REQUIRE(s.source == DpiSource::INFERRED);
  REQUIRE(s.width_mm == Catch::Approx(297.0));
  REQUIRE(s.height_mm == Catch::Approx(210.0));
}

TEST_CASE("physical_size_falls_back_for_square_pages") {
  PhysicalSizeConfig cfg;
  auto s = infer_physical_size(1000, 1000, std::nullopt, 250.0, cfg);
  REQUIRE(s.source == DpiSource::FALLBACK);
  REQUIRE(s.dpi == Catch::Approx(250.0));
  REQUIRE(s.width_mm == Catch::Approx(1000.0 / 250.0 * 25.4));
}

TEST_CASE("physical_size_rejects_non_positive_fallback_dpi") {
  PhysicalSizeConfig cfg;
  REQUIRE_THROWS_AS(infer_physical_size(1000, 1000, std::nullopt, 0.0, cfg),
                    page_norm::ValidationError);
  REQUIRE_THROWS_AS(infer_physical_size(1000, 1000, std::nullopt, -72.0, cfg),
                    page_norm::ValidationError);
  REQUIRE_THROWS_AS(infer_physical_size(2480, 3508, 300.0, 0.0, cfg),
                    page_norm::ValidationError);
}
