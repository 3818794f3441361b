#include "page_norm/config/configuration.hpp"
#include "page_norm/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace page_norm::config {

static bool in_open_unit_half(float v) {
    return v > 0.0f && v <= 0.5f;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["run"]) {
            auto r = node["run"];
            if (r["target_dpi"]) cfg.run.target_dpi = r["target_dpi"].as<float>();
            if (r["target_width_mm"]) cfg.run.target_width_mm = r["target_width_mm"].as<float>();
            if (r["target_height_mm"]) cfg.run.target_height_mm = r["target_height_mm"].as<float>();
            if (r["sample_count"]) cfg.run.sample_count = r["sample_count"].as<int>();
        }

        if (node["physical_size"]) {
            auto p = node["physical_size"];
            if (p["min_trusted_density"]) cfg.physical_size.min_trusted_density = p["min_trusted_density"].as<float>();
            if (p["match_tolerance"]) cfg.physical_size.match_tolerance = p["match_tolerance"].as<float>();
        }

        if (node["preview"]) {
            auto p = node["preview"];
            if (p["max_dim"]) cfg.preview.max_dim = p["max_dim"].as<int>();
        }

        if (node["deskew"]) {
            auto d = node["deskew"];
            if (d["max_skew_degrees"]) cfg.deskew.max_skew_degrees = d["max_skew_degrees"].as<float>();
            if (d["histogram_window"]) cfg.deskew.histogram_window = d["histogram_window"].as<int>();
            if (d["gradient_noise_floor"]) cfg.deskew.gradient_noise_floor = d["gradient_noise_floor"].as<float>();
            if (d["confidence_scale"]) cfg.deskew.confidence_scale = d["confidence_scale"].as<float>();
        }

        if (node["background"]) {
            auto b = node["background"];
            if (b["border_sample_ratio"]) cfg.background.border_sample_ratio = b["border_sample_ratio"].as<float>();
            if (b["intensity_std_factor"]) cfg.background.intensity_std_factor = b["intensity_std_factor"].as<float>();
            if (b["intensity_min_offset"]) cfg.background.intensity_min_offset = b["intensity_min_offset"].as<float>();
        }

        if (node["bounds"]) {
            auto b = node["bounds"];
            if (b["intensity_line_fraction"]) cfg.bounds.intensity_line_fraction = b["intensity_line_fraction"].as<float>();
            if (b["edge_line_fraction"]) cfg.bounds.edge_line_fraction = b["edge_line_fraction"].as<float>();
            if (b["min_line_count"]) cfg.bounds.min_line_count = b["min_line_count"].as<int>();
            if (b["edge_threshold_scale"]) cfg.bounds.edge_threshold_scale = b["edge_threshold_scale"].as<float>();
            if (b["edge_threshold_floor"]) cfg.bounds.edge_threshold_floor = b["edge_threshold_floor"].as<float>();
            if (b["min_padding_px"]) cfg.bounds.min_padding_px = b["min_padding_px"].as<int>();
            if (b["padding_ratio"]) cfg.bounds.padding_ratio = b["padding_ratio"].as<float>();
        }

        if (node["shadow"]) {
            auto s = node["shadow"];
            if (s["strip_ratio"]) cfg.shadow.strip_ratio = s["strip_ratio"].as<float>();
            if (s["min_strip_px"]) cfg.shadow.min_strip_px = s["min_strip_px"].as<int>();
            if (s["min_delta"]) cfg.shadow.min_delta = s["min_delta"].as<float>();
            if (s["delta_ratio"]) cfg.shadow.delta_ratio = s["delta_ratio"].as<float>();
            if (s["trim_confidence"]) cfg.shadow.trim_confidence = s["trim_confidence"].as<float>();
            if (s["trim_fraction"]) cfg.shadow.trim_fraction = s["trim_fraction"].as<float>();
        }

        if (node["review"]) {
            auto r = node["review"];
            if (r["min_mask_coverage"]) cfg.review.min_mask_coverage = r["min_mask_coverage"].as<float>();
            if (r["min_deskew_confidence"]) cfg.review.min_deskew_confidence = r["min_deskew_confidence"].as<float>();
            if (r["deskew_confidence_bias"]) cfg.review.deskew_confidence_bias = r["deskew_confidence_bias"].as<float>();
            if (r["low_coverage_flag"]) cfg.review.low_coverage_flag = r["low_coverage_flag"].as<float>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["normalized_dir"]) cfg.output.normalized_dir = o["normalized_dir"].as<std::string>();
            if (o["sidecars_dir"]) cfg.output.sidecars_dir = o["sidecars_dir"].as<std::string>();
            if (o["artifacts_dir"]) cfg.output.artifacts_dir = o["artifacts_dir"].as<std::string>();
            if (o["format"]) cfg.output.format = o["format"].as<std::string>();
            if (o["png_compression"]) cfg.output.png_compression = o["png_compression"].as<int>();
            if (o["write_sidecars"]) cfg.output.write_sidecars = o["write_sidecars"].as<bool>();
        }

        if (node["runtime_limits"]) {
            auto rl = node["runtime_limits"];
            if (rl["parallel_workers"]) cfg.runtime_limits.parallel_workers = rl["parallel_workers"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["run"]["target_dpi"] = run.target_dpi;
    node["run"]["target_width_mm"] = run.target_width_mm;
    node["run"]["target_height_mm"] = run.target_height_mm;
    node["run"]["sample_count"] = run.sample_count;

    node["physical_size"]["min_trusted_density"] = physical_size.min_trusted_density;
    node["physical_size"]["match_tolerance"] = physical_size.match_tolerance;

    node["preview"]["max_dim"] = preview.max_dim;

    node["deskew"]["max_skew_degrees"] = deskew.max_skew_degrees;
    node["deskew"]["histogram_window"] = deskew.histogram_window;
    node["deskew"]["gradient_noise_floor"] = deskew.gradient_noise_floor;
    node["deskew"]["confidence_scale"] = deskew.confidence_scale;

    node["background"]["border_sample_ratio"] = background.border_sample_ratio;
    node["background"]["intensity_std_factor"] = background.intensity_std_factor;
    node["background"]["intensity_min_offset"] = background.intensity_min_offset;

    node["bounds"]["intensity_line_fraction"] = bounds.intensity_line_fraction;
    node["bounds"]["edge_line_fraction"] = bounds.edge_line_fraction;
    node["bounds"]["min_line_count"] = bounds.min_line_count;
    node["bounds"]["edge_threshold_scale"] = bounds.edge_threshold_scale;
    node["bounds"]["edge_threshold_floor"] = bounds.edge_threshold_floor;
    node["bounds"]["min_padding_px"] = bounds.min_padding_px;
    node["bounds"]["padding_ratio"] = bounds.padding_ratio;

    node["shadow"]["strip_ratio"] = shadow.strip_ratio;
    node["shadow"]["min_strip_px"] = shadow.min_strip_px;
    node["shadow"]["min_delta"] = shadow.min_delta;
    node["shadow"]["delta_ratio"] = shadow.delta_ratio;
    node["shadow"]["trim_confidence"] = shadow.trim_confidence;
    node["shadow"]["trim_fraction"] = shadow.trim_fraction;

    node["review"]["min_mask_coverage"] = review.min_mask_coverage;
    node["review"]["min_deskew_confidence"] = review.min_deskew_confidence;
    node["review"]["deskew_confidence_bias"] = review.deskew_confidence_bias;
    node["review"]["low_coverage_flag"] = review.low_coverage_flag;

    node["output"]["normalized_dir"] = output.normalized_dir;
    node["output"]["sidecars_dir"] = output.sidecars_dir;
    node["output"]["artifacts_dir"] = output.artifacts_dir;
    node["output"]["format"] = output.format;
    node["output"]["png_compression"] = output.png_compression;
    node["output"]["write_sidecars"] = output.write_sidecars;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;

    return node;
}

void Config::validate() const {
    if (!(run.target_dpi > 0.0f)) {
        throw ValidationError("run.target_dpi must be > 0");
    }
    if (!(run.target_width_mm > 0.0f) || !(run.target_height_mm > 0.0f)) {
        throw ValidationError("run.target_width_mm and run.target_height_mm must be > 0");
    }
    if (run.sample_count < 0) {
        throw ValidationError("run.sample_count must be >= 0");
    }

    if (physical_size.min_trusted_density < 0.0f) {
        throw ValidationError("physical_size.min_trusted_density must be >= 0");
    }
    if (!(physical_size.match_tolerance > 0.0f) || physical_size.match_tolerance > 1.0f) {
        throw ValidationError("physical_size.match_tolerance must be in (0,1]");
    }

    if (preview.max_dim < 16) {
        throw ValidationError("preview.max_dim must be >= 16");
    }

    if (!(deskew.max_skew_degrees > 0.0f) || deskew.max_skew_degrees > 45.0f) {
        throw ValidationError("deskew.max_skew_degrees must be in (0,45]");
    }
    if (deskew.histogram_window < 0 || deskew.histogram_window > 15) {
        throw ValidationError("deskew.histogram_window must be in [0,15]");
    }
    if (deskew.gradient_noise_floor < 0.0f) {
        throw ValidationError("deskew.gradient_noise_floor must be >= 0");
    }
    if (!(deskew.confidence_scale > 0.0f)) {
        throw ValidationError("deskew.confidence_scale must be > 0");
    }

    if (!in_open_unit_half(background.border_sample_ratio)) {
        throw ValidationError("background.border_sample_ratio must be in (0,0.5]");
    }
    if (background.intensity_std_factor < 0.0f) {
        throw ValidationError("background.intensity_std_factor must be >= 0");
    }
    if (background.intensity_min_offset < 0.0f) {
        throw ValidationError("background.intensity_min_offset must be >= 0");
    }

    if (!in_open_unit_half(bounds.intensity_line_fraction) ||
        !in_open_unit_half(bounds.edge_line_fraction)) {
        throw ValidationError("bounds.intensity_line_fraction/edge_line_fraction must be in (0,0.5]");
    }
    if (bounds.min_line_count < 1) {
        throw ValidationError("bounds.min_line_count must be >= 1");
    }
    if (bounds.edge_threshold_scale < 0.0f || bounds.edge_threshold_floor < 0.0f) {
        throw ValidationError("bounds.edge_threshold_scale/edge_threshold_floor must be >= 0");
    }
    if (bounds.min_padding_px < 0) {
        throw ValidationError("bounds.min_padding_px must be >= 0");
    }
    if (bounds.padding_ratio < 0.0f || bounds.padding_ratio > 0.5f) {
        throw ValidationError("bounds.padding_ratio must be in [0,0.5]");
    }

    if (!in_open_unit_half(shadow.strip_ratio)) {
        throw ValidationError("shadow.strip_ratio must be in (0,0.5]");
    }
    if (shadow.min_strip_px < 1) {
        throw ValidationError("shadow.min_strip_px must be >= 1");
    }
    if (shadow.min_delta < 0.0f || shadow.delta_ratio < 0.0f) {
        throw ValidationError("shadow.min_delta/delta_ratio must be >= 0");
    }
    if (shadow.trim_confidence < 0.0f || shadow.trim_confidence > 1.0f) {
        throw ValidationError("shadow.trim_confidence must be in [0,1]");
    }
    if (shadow.trim_fraction < 0.0f || shadow.trim_fraction > 1.0f) {
        throw ValidationError("shadow.trim_fraction must be in [0,1]");
    }

    if (review.min_mask_coverage < 0.0f || review.min_mask_coverage > 1.0f ||
        review.min_deskew_confidence < 0.0f || review.min_deskew_confidence > 1.0f ||
        review.low_coverage_flag < 0.0f || review.low_coverage_flag > 1.0f) {
        throw ValidationError("review thresholds must be in [0,1]");
    }
    if (review.deskew_confidence_bias < 0.0f || review.deskew_confidence_bias > 1.0f) {
        throw ValidationError("review.deskew_confidence_bias must be in [0,1]");
    }

    if (output.normalized_dir.empty() || output.sidecars_dir.empty() ||
        output.artifacts_dir.empty()) {
        throw ValidationError("output directories must not be empty");
    }
    if (output.format != "png" && output.format != "tiff") {
        throw ValidationError("output.format must be 'png' or 'tiff'");
    }
    if (output.png_compression < 0 || output.png_compression > 9) {
        throw ValidationError("output.png_compression must be in [0,9]");
    }

    if (runtime_limits.parallel_workers < 1 || runtime_limits.parallel_workers > 64) {
        throw ValidationError("runtime_limits.parallel_workers must be in [1,64]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "run": {
      "type": "object",
      "properties": {
        "target_dpi": {"type": "number", "exclusiveMinimum": 0},
        "target_width_mm": {"type": "number", "exclusiveMinimum": 0},
        "target_height_mm": {"type": "number", "exclusiveMinimum": 0},
        "sample_count": {"type": "integer", "minimum": 0}
      }
    },
    "physical_size": {
      "type": "object",
      "properties": {
        "min_trusted_density": {"type": "number", "minimum": 0},
        "match_tolerance": {"type": "number", "exclusiveMinimum": 0, "maximum": 1}
      }
    },
    "preview": {
      "type": "object",
      "properties": {
        "max_dim": {"type": "integer", "minimum": 16}
      }
    },
    "deskew": {
      "type": "object",
      "properties": {
        "max_skew_degrees": {"type": "number", "exclusiveMinimum": 0, "maximum": 45},
        "histogram_window": {"type": "integer", "minimum": 0, "maximum": 15},
        "gradient_noise_floor": {"type": "number", "minimum": 0},
        "confidence_scale": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "background": {
      "type": "object",
      "properties": {
        "border_sample_ratio": {"type": "number", "exclusiveMinimum": 0, "maximum": 0.5},
        "intensity_std_factor": {"type": "number", "minimum": 0},
        "intensity_min_offset": {"type": "number", "minimum": 0}
      }
    },
    "bounds": {
      "type": "object",
      "properties": {
        "intensity_line_fraction": {"type": "number", "exclusiveMinimum": 0, "maximum": 0.5},
        "edge_line_fraction": {"type": "number", "exclusiveMinimum": 0, "maximum": 0.5},
        "min_line_count": {"type": "integer", "minimum": 1},
        "edge_threshold_scale": {"type": "number", "minimum": 0},
        "edge_threshold_floor": {"type": "number", "minimum": 0},
        "min_padding_px": {"type": "integer", "minimum": 0},
        "padding_ratio": {"type": "number", "minimum": 0, "maximum": 0.5}
      }
    },
    "shadow": {
      "type": "object",
      "properties": {
        "strip_ratio": {"type": "number", "exclusiveMinimum": 0, "maximum": 0.5},
        "min_strip_px": {"type": "integer", "minimum": 1},
        "min_delta": {"type": "number", "minimum": 0},
        "delta_ratio": {"type": "number", "minimum": 0},
        "trim_confidence": {"type": "number", "minimum": 0, "maximum": 1},
        "trim_fraction": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "review": {
      "type": "object",
      "properties": {
        "min_mask_coverage": {"type": "number", "minimum": 0, "maximum": 1},
        "min_deskew_confidence": {"type": "number", "minimum": 0, "maximum": 1},
        "deskew_confidence_bias": {"type": "number", "minimum": 0, "maximum": 1},
        "low_coverage_flag": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "normalized_dir": {"type": "string", "minLength": 1},
        "sidecars_dir": {"type": "string", "minLength": 1},
        "artifacts_dir": {"type": "string", "minLength": 1},
        "format": {"type": "string", "enum": ["png", "tiff"]},
        "png_compression": {"type": "integer", "minimum": 0, "maximum": 9},
        "write_sidecars": {"type": "boolean"}
      }
    },
    "runtime_limits": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64}
      }
    }
  }
})";
}

} // namespace page_norm::config
