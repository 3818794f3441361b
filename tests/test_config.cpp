#include "page_norm/config/configuration.hpp"
#include "page_norm/core/errors.hpp"

#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using page_norm::config::Config;

TEST_CASE("default_config_is_valid") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.run.target_dpi == Catch::Approx(300.0f));
  REQUIRE(cfg.output.format == "png");
  REQUIRE(cfg.runtime_limits.parallel_workers == 4);
}

TEST_CASE("config_from_yaml_overrides_sections") {
  YAML::Node node = YAML::Load(
      "run:\n"
      "  target_dpi: 400\n"
      "deskew:\n"
      "  max_skew_degrees: 5\n"
      "output:\n"
      "  format: tiff\n"
      "  write_sidecars: false\n");
  Config cfg = Config::from_yaml(node);
  REQUIRE(cfg.run.target_dpi == Catch::Approx(400.0f));
  REQUIRE(cfg.deskew.max_skew_degrees == Catch::Approx(5.0f));
  REQUIRE(cfg.deskew.histogram_window == 3);
  REQUIRE(cfg.output.format == "tiff");
  REQUIRE_FALSE(cfg.output.write_sidecars);
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validate_rejects_bad_values") {
  Config cfg;
  cfg.output.format = "jpeg";
  REQUIRE_THROWS_AS(cfg.validate(), page_norm::ValidationError);

  cfg = Config{};
  cfg.runtime_limits.parallel_workers = 0;
  REQUIRE_THROWS_AS(cfg.validate(), page_norm::ValidationError);

  cfg = Config{};
  cfg.review.min_mask_coverage = 1.5f;
  REQUIRE_THROWS_AS(cfg.validate(), page_norm::ValidationError);
}

TEST_CASE("config_bad_scalar_is_config_error") {
  YAML::Node node = YAML::Load("preview:\n  max_dim: big\n");
  REQUIRE_THROWS_AS(Config::from_yaml(node), page_norm::ConfigError);
}

TEST_CASE("config_save_and_load") {
  page_norm_test::TempDir dir("config");
  Config cfg;
  cfg.run.target_dpi = 600.0f;
  cfg.bounds.min_padding_px = 12;
  cfg.save(dir.path() / "config.yaml");

  Config loaded = Config::load(dir.path() / "config.yaml");
  REQUIRE(loaded.run.target_dpi == Catch::Approx(600.0f));
  REQUIRE(loaded.bounds.min_padding_px == 12);
  REQUIRE_THROWS_AS(Config::load(dir.path() / "missing.yaml"), page_norm::ConfigError);
}

TEST_CASE("config_load_reports_unusable_files") {
  page_norm_test::TempDir dir("config_load");
  {
    std::ofstream out(dir.path() / "broken.yaml");
    out << "run: [unclosed\n";
  }

  std::string missing_message;
  try {
    Config::load(dir.path() / "missing.yaml");
  } catch (const page_norm::ConfigError &e) {
    missing_message = e.what();
  }
  REQUIRE(missing_message.find("Config file not found") != std::string::npos);
  REQUIRE(missing_message.find("missing.yaml") != std::string::npos);

  REQUIRE_THROWS_AS(Config::load(dir.path() / "broken.yaml"), page_norm::ConfigError);
}

TEST_CASE("config_schema_is_json") {
  auto schema = nlohmann::json::parse(page_norm::config::get_schema_json());
  REQUIRE(schema.contains("properties"));
  REQUIRE(schema["properties"].contains("output"));
}
