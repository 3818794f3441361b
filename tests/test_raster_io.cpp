#include "page_norm/core/errors.hpp"
#include "page_norm/io/raster_io.hpp"

#include "test_support.hpp"

#include <opencv2/imgcodecs.hpp>

#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace page_norm::io;

TEST_CASE("encoder_output_without_resolution_has_no_density") {
  cv::Mat img(10, 12, CV_8UC1, cv::Scalar(128));
  std::vector<uint8_t> png;
  REQUIRE(cv::imencode(".png", img, png));
  REQUIRE_FALSE(read_density_hint(png).has_value());

  // JFIF written with a 1:1 aspect ratio and no unit
  std::vector<uint8_t> jpeg;
  REQUIRE(cv::imencode(".jpg", img, jpeg));
  REQUIRE_FALSE(read_density_hint(jpeg).has_value());

  REQUIRE_FALSE(read_density_hint(std::vector<uint8_t>{}).has_value());
}

TEST_CASE("unreadable_header_is_decode_error") {
  std::vector<uint8_t> junk(64, 0x5A);
  REQUIRE_THROWS_AS(read_density_hint(junk), page_norm::DecodeError);
}

TEST_CASE("write_raster_with_dpi_roundtrips_through_loader") {
  page_norm_test::TempDir dir("raster");
  page_norm::config::OutputConfig cfg;
  cv::Mat img(40, 30, CV_8UC3, cv::Scalar(10, 200, 30));
  const auto path = dir.path() / ("page" + output_extension(cfg));
  write_raster_with_dpi(path, img, 200.0, cfg);

  SourceRaster src = load_source_raster(path);
  REQUIRE(src.width == 30);
  REQUIRE(src.height == 40);
  REQUIRE(src.pixels.channels() == 3);
  REQUIRE(src.density.has_value());
  REQUIRE(*src.density == Catch::Approx(200.0).margin(0.01));
}

TEST_CASE("tiff_output_keeps_pixels_and_resolution") {
  page_norm_test::TempDir dir("raster_tiff");
  page_norm::config::OutputConfig cfg;
  cfg.format = "tiff";
  REQUIRE(output_extension(cfg) == ".tiff");

  cv::Mat img(24, 36, CV_8UC1, cv::Scalar(255));
  img(cv::Rect(5, 4, 10, 8)).setTo(cv::Scalar(20));
  const auto path = dir.path() / ("page" + output_extension(cfg));
  write_raster_with_dpi(path, img, 300.0, cfg);

  auto dpi = read_density_hint(path);
  REQUIRE(dpi.has_value());
  REQUIRE(*dpi == Catch::Approx(300.0).margin(0.01));

  SourceRaster src = load_source_raster(path);
  REQUIRE(src.width == 36);
  REQUIRE(src.height == 24);
  cv::Mat gray = to_gray_u8(src.pixels);
  REQUIRE(gray.at<uint8_t>(0, 0) == 255);
  REQUIRE(gray.at<uint8_t>(6, 8) == 20);
  REQUIRE(src.density.has_value());
  REQUIRE(*src.density == Catch::Approx(300.0).margin(0.01));
}

TEST_CASE("write_to_missing_directory_is_output_error") {
  page_norm_test::TempDir dir("raster_missing");
  page_norm::config::OutputConfig cfg;
  cv::Mat img(4, 4, CV_8UC1, cv::Scalar(0));
  REQUIRE_THROWS_AS(write_raster_with_dpi(dir.path() / "nope" / "x.png", img, 300.0, cfg),
                    page_norm::OutputError);
}

TEST_CASE("undecodable_input_is_decode_error") {
  page_norm_test::TempDir dir("decode");
  {
    std::ofstream out(dir.path() / "bad.png", std::ios::binary);
    out << "not an image";
  }
  { std::ofstream out(dir.path() / "empty.png", std::ios::binary); }
  REQUIRE_THROWS_AS(load_source_raster(dir.path() / "bad.png"), page_norm::DecodeError);
  REQUIRE_THROWS_AS(load_source_raster(dir.path() / "empty.png"), page_norm::DecodeError);
  REQUIRE_THROWS_AS(load_source_raster(dir.path() / "missing.png"), page_norm::DecodeError);
}

TEST_CASE("preview_is_bounded_by_max_dim") {
  cv::Mat img(2000, 3000, CV_8UC3, cv::Scalar(255, 255, 255));
  auto preview = make_preview(img, 1600);
  REQUIRE(preview.width() == 1600);
  REQUIRE(preview.height() == 1067);
  REQUIRE(preview.scale == Catch::Approx(1600.0 / 3000.0));
  REQUIRE(preview.pixels(500, 800) == Catch::Approx(255.0f));

  cv::Mat small(100, 50, CV_8UC1, cv::Scalar(7));
  auto same = make_preview(small, 1600);
  REQUIRE(same.scale == 1.0);
  REQUIRE(same.width() == 50);
  REQUIRE(same.height() == 100);
}
