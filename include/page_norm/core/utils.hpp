#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace page_norm::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_images(const fs::path& input_dir,
                                      const std::string& pattern = "*.png;*.jpg;*.jpeg;*.tif;*.tiff");
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void copy_config(const fs::path& src, const fs::path& dst);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

// Glob pattern matching; ';' separates alternatives
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace page_norm::core
