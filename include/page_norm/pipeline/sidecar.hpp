#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"
#include "page_norm/pipeline/normalize_page.hpp"
#include "page_norm/pipeline/review.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace page_norm::pipeline {

using json = nlohmann::json;

constexpr const char *kSidecarVersion = "1.0.0";

// cover | title | chapter | body, from the page position and file name.
std::string infer_layout_profile(const PageSource &page, size_t index);

json shadow_to_json(const ShadowDetection &shadow);

json build_sidecar(const PageSource &page, const NormalizationResult &result,
                   const ReviewDecision &decision, size_t index, const std::string &run_id);

fs::path sidecar_output_path(const fs::path &output_dir, const std::string &page_id,
                             const config::OutputConfig &cfg);

// Throws OutputError.
void write_json_file(const fs::path &path, const json &doc);

// Writes one sidecar per normalized page, in page order. Returns the count written.
size_t write_sidecars(const std::vector<PageSource> &pages, const BatchResult &batch,
                      const config::Config &cfg, const fs::path &output_dir,
                      const std::string &run_id);

struct RunMetrics {
  size_t pages_total = 0;
  size_t normalized_pages = 0;
  size_t failed_pages = 0;
  size_t accepted_pages = 0;
  size_t low_coverage_count = 0;
  double avg_skew_deg = 0.0;
  double avg_mask_coverage = 0.0;
  double shadow_rate = 0.0;
};

RunMetrics summarize_run(size_t pages_total, const BatchResult &batch,
                         const config::ReviewConfig &cfg);

std::vector<std::string> run_observations(const RunMetrics &m);
std::vector<std::string> run_recommendations(const RunMetrics &m);

// Reports the run's target DPI and page dimensions alongside the metrics.
json build_run_summary(const std::string &run_id, const RunMetrics &metrics,
                       const BatchResult &batch, double duration_ms,
                       const config::RunConfig &run);

} // namespace page_norm::pipeline
