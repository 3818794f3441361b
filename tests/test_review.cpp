#include "page_norm/pipeline/review.hpp"

#include <algorithm>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using page_norm::NormalizationResult;
using page_norm::ShadowSide;
using page_norm::config::ReviewConfig;
using page_norm::pipeline::ReviewDecision;
using page_norm::pipeline::evaluate_review;

namespace {

NormalizationResult result_with(double coverage, double skew_confidence) {
  NormalizationResult r;
  r.page_id = "p1";
  r.stats.mask_coverage = coverage;
  r.stats.skew_confidence = skew_confidence;
  return r;
}

bool has(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST_CASE("review_accepts_good_coverage_with_bias") {
  ReviewConfig cfg;
  ReviewDecision d = evaluate_review(result_with(0.8, 0.0), cfg);
  REQUIRE(d.accepted);
  REQUIRE(d.notes == "Auto-accepted");
  REQUIRE(d.deskew_confidence == Catch::Approx(0.25));
  REQUIRE(d.failed_rules.empty());
  REQUIRE(d.flags.empty());
}

TEST_CASE("review_flags_low_coverage") {
  ReviewConfig cfg;
  ReviewDecision d = evaluate_review(result_with(0.4, 0.5), cfg);
  REQUIRE_FALSE(d.accepted);
  REQUIRE(d.notes == "Requires review");
  REQUIRE(has(d.failed_rules, "mask_coverage"));
  REQUIRE(has(d.flags, "low-coverage"));
}

TEST_CASE("review_fails_weak_deskew_confidence") {
  ReviewConfig cfg;
  cfg.min_deskew_confidence = 0.5f;
  ReviewDecision d = evaluate_review(result_with(0.9, 0.1), cfg);
  REQUIRE_FALSE(d.accepted);
  REQUIRE(d.failed_rules == std::vector<std::string>{"deskew_confidence"});
}

TEST_CASE("review_confidence_saturates_at_one") {
  ReviewConfig cfg;
  REQUIRE(page_norm::pipeline::derived_deskew_confidence(0.95, cfg) == Catch::Approx(1.0));
}

TEST_CASE("review_flags_shadow_side") {
  ReviewConfig cfg;
  NormalizationResult r = result_with(0.9, 0.5);
  r.shadow.present = true;
  r.shadow.side = ShadowSide::RIGHT;
  ReviewDecision d = evaluate_review(r, cfg);
  REQUIRE(d.accepted);
  REQUIRE(d.flags == std::vector<std::string>{"shadow:right"});
}
