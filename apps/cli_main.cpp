#include "page_norm/config/configuration.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/core/types.hpp"
#include "page_norm/geometry/physical_size.hpp"
#include "page_norm/io/corpus_io.hpp"
#include "page_norm/io/raster_io.hpp"
#include "page_norm/pipeline/normalize_page.hpp"
#include "page_norm/pipeline/sidecar.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static page_norm::config::Config load_config_or_default(const std::string& path) {
    if (path.empty()) return page_norm::config::Config{};
    auto cfg = page_norm::config::Config::load(path);
    cfg.validate();
    return cfg;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << page_norm::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config (--path <p> | --yaml <text> | --stdin) [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        page_norm::config::Config cfg;
        if (!path.empty()) {
            cfg = page_norm::config::Config::load(path);
        } else {
            YAML::Node node = YAML::Load(use_stdin ? read_stdin() : yaml_arg);
            cfg = page_norm::config::Config::from_yaml(node);
        }
        cfg.validate();
        result["valid"] = true;
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("YAML parse error: ") + e.what());
    } catch (const page_norm::PageNormError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// scan <input_dir> [--with-checksums]
// ============================================================================
int cmd_scan(const std::string& input_path, bool with_checksums) {
    fs::path p(input_path);

    json result;
    result["ok"] = false;
    result["input_path"] = input_path;
    result["pages_detected"] = 0;
    result["pages"] = json::array();
    result["errors"] = json::array();

    if (!fs::is_directory(p)) {
        json err;
        err["severity"] = "error";
        err["code"] = "input_path_not_directory";
        err["message"] = "Input path is not a directory: " + input_path;
        result["errors"].push_back(err);
        print_json(result);
        return 0;
    }

    try {
        auto pages = page_norm::io::discover_page_sources(p, with_checksums, true);
        for (const auto& page : pages) {
            if (page.width_px <= 0 || page.height_px <= 0) {
                json err;
                err["severity"] = "error";
                err["code"] = "image_read_error";
                err["message"] = "Cannot decode " + page.filename;
                result["errors"].push_back(err);
                continue;
            }
            result["pages"].push_back(json(page));
        }
    } catch (const page_norm::IOError& e) {
        json err;
        err["severity"] = "error";
        err["code"] = "io_error";
        err["message"] = e.what();
        result["errors"].push_back(err);
    } catch (const page_norm::PageNormError& e) {
        json err;
        err["severity"] = "error";
        err["code"] = "invalid_pages";
        err["message"] = e.what();
        result["errors"].push_back(err);
    }
    result["pages_detected"] = result["pages"].size();
    result["ok"] = result["errors"].empty() && !result["pages"].empty();
    print_json(result);
    return 0;
}

// ============================================================================
// infer-size --width W --height H [--density D] [--fallback-dpi D] [--config P]
// ============================================================================
int cmd_infer_size(int width, int height, std::optional<double> density,
                   std::optional<double> fallback_dpi, const std::string& config_path) {
    try {
        auto cfg = load_config_or_default(config_path);
        const double fallback = fallback_dpi ? *fallback_dpi : cfg.run.target_dpi;
        auto size = page_norm::geometry::infer_physical_size(width, height, density, fallback,
                                                             cfg.physical_size);
        print_json({{"widthMm", size.width_mm},
                    {"heightMm", size.height_mm},
                    {"dpi", size.dpi},
                    {"dpiSource", page_norm::dpi_source_to_string(size.source)}});
        return 0;
    } catch (const page_norm::PageNormError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}

// ============================================================================
// analyze <image> [--config P]
// ============================================================================
int cmd_analyze(const std::string& image_path, const std::string& config_path) {
    try {
        auto cfg = load_config_or_default(config_path);
        auto src = page_norm::io::load_source_raster(image_path);
        auto preview = page_norm::io::make_preview(src.pixels, cfg.preview.max_dim);
        auto a = page_norm::pipeline::analyze_preview(preview, cfg);

        json stages = a.bounds.applied_stages;
        json result = {
            {"path", image_path},
            {"widthPx", src.width},
            {"heightPx", src.height},
            {"preview", {{"width", preview.width()}, {"height", preview.height()}, {"scale", preview.scale}}},
            {"skew", {{"angle", a.skew.angle_deg}, {"confidence", a.skew.confidence}}},
            {"border", {{"mean", a.border.mean}, {"std", a.border.std}}},
            {"shadow", page_norm::pipeline::shadow_to_json(a.shadow)},
            {"bounds",
             {{"intensityThreshold", a.bounds.intensity_threshold},
              {"edgeThreshold", a.bounds.edge_threshold},
              {"intensityBox", a.bounds.intensity_box ? json(*a.bounds.intensity_box) : json(nullptr)},
              {"edgeBox", a.bounds.edge_box ? json(*a.bounds.edge_box) : json(nullptr)},
              {"maskBox", a.bounds.mask_box},
              {"expandedBox", a.bounds.expanded_box},
              {"paddingPx", a.bounds.padding_px},
              {"shadowTrimPx", a.bounds.shadow_trim_px},
              {"maskCoverage", a.bounds.mask_coverage},
              {"stages", stages}}}};
        if (src.density) result["density"] = *src.density;
        print_json(result);
        return 0;
    } catch (const page_norm::PageNormError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}

static void print_usage() {
    std::cout << "Usage: page_norm_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  get-schema                      Print config JSON schema\n"
              << "  validate-config --path <p>      Validate a config file (--yaml, --stdin, --strict-exit-codes)\n"
              << "  scan <input_dir> [--with-checksums]  List page images as page source records\n"
              << "  infer-size --width W --height H [--density D] [--fallback-dpi D]\n"
              << "                                  Physical size and DPI for pixel dimensions\n"
              << "  analyze <image> [--config P]    Run preview analysis without writing output\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    page_norm::io::initialize_codecs(argv[0]);

    std::string command = argv[1];

    // Helper to find argument value
    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "scan") {
        std::string input_path = get_positional(0);
        if (input_path.empty()) {
            std::cerr << "scan requires an input_dir argument\n";
            return 1;
        }
        return cmd_scan(input_path, has_flag("--with-checksums"));
    }

    if (command == "infer-size") {
        std::string w = get_arg("--width");
        std::string h = get_arg("--height");
        if (w.empty() || h.empty()) {
            std::cerr << "infer-size requires --width and --height\n";
            return 1;
        }
        int width = 0;
        int height = 0;
        std::optional<double> density;
        std::optional<double> fallback;
        try {
            width = std::stoi(w);
            height = std::stoi(h);
            std::string d = get_arg("--density");
            std::string f = get_arg("--fallback-dpi");
            if (!d.empty()) density = std::stod(d);
            if (!f.empty()) fallback = std::stod(f);
        } catch (const std::logic_error& e) {
            std::cerr << "infer-size: invalid number (" << e.what() << ")\n";
            return 1;
        }
        if (width <= 0 || height <= 0) {
            std::cerr << "infer-size: --width and --height must be positive\n";
            return 1;
        }
        if (fallback && !(*fallback > 0.0)) {
            std::cerr << "infer-size: --fallback-dpi must be positive\n";
            return 1;
        }
        return cmd_infer_size(width, height, density, fallback, get_arg("--config"));
    }

    if (command == "analyze") {
        std::string path = get_positional(0);
        if (path.empty()) {
            std::cerr << "analyze requires an image path argument\n";
            return 1;
        }
        return cmd_analyze(path, get_arg("--config"));
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
