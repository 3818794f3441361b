#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace page_norm::pipeline {

struct ReviewRule {
  std::string name;
  std::function<bool(const NormalizationResult &, const config::ReviewConfig &)> passes;
};

struct ReviewDecision {
  bool accepted = false;
  std::string notes;
  double deskew_confidence = 0.0;
  std::vector<std::string> failed_rules;
  std::vector<std::string> flags;
};

// min(1, skew_confidence + bias)
double derived_deskew_confidence(double skew_confidence, const config::ReviewConfig &cfg);

// mask_coverage, deskew_confidence
const std::vector<ReviewRule> &review_rules();

// "shadow:<side>" and "low-coverage"
std::vector<std::string> review_flags(const NormalizationResult &result,
                                      const config::ReviewConfig &cfg);

ReviewDecision evaluate_review(const NormalizationResult &result,
                               const config::ReviewConfig &cfg);

} // namespace page_norm::pipeline
