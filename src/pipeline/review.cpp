#include "page_norm/pipeline/review.hpp"

#include <algorithm>

namespace page_norm::pipeline {

double derived_deskew_confidence(double skew_confidence, const config::ReviewConfig &cfg) {
  return std::min(1.0, skew_confidence + cfg.deskew_confidence_bias);
}

const std::vector<ReviewRule> &review_rules() {
  static const std::vector<ReviewRule> rules = {
      {"mask_coverage",
       [](const NormalizationResult &r, const config::ReviewConfig &cfg) {
         return r.stats.mask_coverage >= cfg.min_mask_coverage;
       }},
      {"deskew_confidence",
       [](const NormalizationResult &r, const config::ReviewConfig &cfg) {
         return derived_deskew_confidence(r.stats.skew_confidence, cfg) >=
                cfg.min_deskew_confidence;
       }},
  };
  return rules;
}

std::vector<std::string> review_flags(const NormalizationResult &result,
                                      const config::ReviewConfig &cfg) {
  std::vector<std::string> flags;
  if (result.shadow.present) {
    flags.push_back("shadow:" + shadow_side_to_string(result.shadow.side));
  }
  if (result.stats.mask_coverage < cfg.low_coverage_flag) {
    flags.push_back("low-coverage");
  }
  return flags;
}

ReviewDecision evaluate_review(const NormalizationResult &result,
                               const config::ReviewConfig &cfg) {
  ReviewDecision d;
  d.deskew_confidence = derived_deskew_confidence(result.stats.skew_confidence, cfg);
  for (const auto &rule : review_rules()) {
    if (!rule.passes(result, cfg)) {
      d.failed_rules.push_back(rule.name);
    }
  }
  d.accepted = d.failed_rules.empty();
  d.notes = d.accepted ? "Auto-accepted" : "Requires review";
  d.flags = review_flags(result, cfg);
  return d;
}

} // namespace page_norm::pipeline
