#pragma once

#include "page_norm/core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace page_norm {

// JSON mapping for corpus records; boxes are [left, top, right, bottom].
void to_json(nlohmann::json& j, const Box& b);
void from_json(const nlohmann::json& j, Box& b);
void to_json(nlohmann::json& j, const PageSource& p);
void from_json(const nlohmann::json& j, PageSource& p);
void to_json(nlohmann::json& j, const BoundsEstimate& e);
void from_json(const nlohmann::json& j, BoundsEstimate& e);

} // namespace page_norm

namespace page_norm::io {

// Accepts a bare array or an object holding a "pages" array. Page ids must be unique.
std::vector<PageSource> load_page_sources(const fs::path& path);

// Accepts a bare array or an object holding an "estimates" array, one per page id.
std::map<std::string, BoundsEstimate> load_bounds_estimates(const fs::path& path);

// Sorted image files of a directory; ids are file stems. Dimensions are read
// from the decoded image when probe_dimensions is set. Two files sharing a stem
// raise ValidationError.
std::vector<PageSource> discover_page_sources(const fs::path& dir, bool with_checksums,
                                              bool probe_dimensions = false);

} // namespace page_norm::io
