#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace page_norm::config {

namespace fs = std::filesystem;

struct RunConfig {
  float target_dpi = 300.0f;        // fallback DPI when no size can be inferred
  float target_width_mm = 210.0f;
  float target_height_mm = 297.0f;
  int sample_count = 0;             // 0 = all pages
};

struct PhysicalSizeConfig {
  float min_trusted_density = 1.0f; // density hints at or below are ignored
  float match_tolerance = 0.02f;    // |aspect - standard aspect|
};

struct PreviewConfig {
  int max_dim = 1600;
};

struct DeskewConfig {
  float max_skew_degrees = 8.0f;
  int histogram_window = 3;
  float gradient_noise_floor = 10.0f;
  float confidence_scale = 4.0f;    // confidence = peak / (w * h * scale)
};

struct BackgroundConfig {
  float border_sample_ratio = 0.04f;
  float intensity_std_factor = 0.45f;
  float intensity_min_offset = 6.0f;
};

struct BoundsConfig {
  float intensity_line_fraction = 0.008f;
  float edge_line_fraction = 0.004f;
  int min_line_count = 2;
  float edge_threshold_scale = 1.4f;
  float edge_threshold_floor = 8.0f;
  int min_padding_px = 6;
  float padding_ratio = 0.002f;
};

struct ShadowConfig {
  float strip_ratio = 0.04f;
  int min_strip_px = 4;
  float min_delta = 8.0f;
  float delta_ratio = 0.08f;
  float trim_confidence = 0.25f;
  float trim_fraction = 0.75f;
};

struct ReviewConfig {
  float min_mask_coverage = 0.5f;
  float min_deskew_confidence = 0.2f;
  float deskew_confidence_bias = 0.25f;
  float low_coverage_flag = 0.6f;
};

struct OutputConfig {
  std::string normalized_dir = "normalized";
  std::string sidecars_dir = "sidecars";
  std::string artifacts_dir = "artifacts";
  std::string format = "png"; // png | tiff
  int png_compression = 6;
  bool write_sidecars = true;
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
};

struct Config {
  RunConfig run;
  PhysicalSizeConfig physical_size;
  PreviewConfig preview;
  DeskewConfig deskew;
  BackgroundConfig background;
  BoundsConfig bounds;
  ShadowConfig shadow;
  ReviewConfig review;
  OutputConfig output;
  RuntimeLimitsConfig runtime_limits;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace page_norm::config
