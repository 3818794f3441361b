#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace page_norm::geometry {

struct StandardPageSize {
    std::string name;
    double width_mm;
    double height_mm;
};

// Portrait dimensions; both orientations are tried.
const std::vector<StandardPageSize>& standard_page_sizes();

double px_to_mm(double px, double dpi);

// Metadata density first, then nearest standard aspect ratio, then fallback_dpi.
// Throws ValidationError unless fallback_dpi is positive and finite.
PhysicalSize infer_physical_size(int width_px, int height_px,
                                 std::optional<double> density, double fallback_dpi,
                                 const config::PhysicalSizeConfig& cfg);

} // namespace page_norm::geometry
