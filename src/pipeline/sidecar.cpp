#include "page_norm/pipeline/sidecar.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/core/utils.hpp"
#include "page_norm/io/corpus_io.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace page_norm::pipeline {

namespace {

bool contains(const std::string &haystack, const char *needle) {
  return haystack.find(needle) != std::string::npos;
}

std::string fixed(double v, int digits) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(digits) << v;
  return oss.str();
}

} // namespace

std::string infer_layout_profile(const PageSource &page, size_t index) {
  const std::string name = core::to_lower(page.filename.empty()
                                              ? page.path.filename().string()
                                              : page.filename);
  if (index == 0 || contains(name, "cover")) return "cover";
  if (contains(name, "title") || contains(name, "frontispiece")) return "title";
  if (contains(name, "chapter") || contains(name, "chap") || contains(name, "page_001")) {
    return "chapter";
  }
  return "body";
}

json shadow_to_json(const ShadowDetection &shadow) {
  return {{"present", shadow.present},
          {"side", shadow_side_to_string(shadow.side)},
          {"widthPx", shadow.width_px},
          {"confidence", shadow.confidence},
          {"darkness", shadow.darkness}};
}

json build_sidecar(const PageSource &page, const NormalizationResult &result,
                   const ReviewDecision &decision, size_t index, const std::string &run_id) {
  json sidecar;
  sidecar["version"] = kSidecarVersion;
  sidecar["pageId"] = page.id;
  sidecar["source"] = {{"path", page.path.string()}, {"checksum", page.checksum}};
  sidecar["dimensions"] = {
      {"width", result.width_mm}, {"height", result.height_mm}, {"unit", "mm"}};
  sidecar["dpi"] = static_cast<long long>(std::llround(result.dpi));
  sidecar["normalization"] = {
      {"cropBox", result.crop_box},
      {"pageMask", result.mask_box},
      {"dpiSource", dpi_source_to_string(result.dpi_source)},
      {"bleed", result.bleed_mm},
      {"trim", result.trim_mm},
      {"scale", 1},
      {"skewAngle", result.skew_angle},
      {"warp", {{"method", "affine"}, {"residual", 0}}},
      {"shadow", shadow_to_json(result.shadow)}};
  json page_bounds = {{"id", page.id + "-page-bounds"},
                      {"type", "page_bounds"},
                      {"bbox", result.crop_box},
                      {"confidence", 0.5},
                      {"source", "local"},
                      {"flags", decision.flags}};
  sidecar["elements"] = json::array();
  sidecar["elements"].push_back(std::move(page_bounds));
  sidecar["layoutProfile"] = infer_layout_profile(page, index);
  sidecar["metrics"] = {{"processingMs", result.processing_ms},
                        {"deskewConfidence", decision.deskew_confidence},
                        {"shadowScore", result.stats.shadow_score},
                        {"maskCoverage", result.stats.mask_coverage},
                        {"backgroundStd", result.stats.background_std}};
  sidecar["decisions"] = {{"accepted", decision.accepted},
                          {"notes", decision.notes},
                          {"overrides", decision.flags}};
  sidecar["normalizationRunId"] = run_id;
  return sidecar;
}

fs::path sidecar_output_path(const fs::path &output_dir, const std::string &page_id,
                             const config::OutputConfig &cfg) {
  return output_dir / cfg.sidecars_dir / (page_id + ".json");
}

void write_json_file(const fs::path &path, const json &doc) {
  try {
    core::write_text(path, doc.dump(2) + "\n");
  } catch (const IOError &) {
    throw OutputError("Cannot write file: " + path.string());
  }
}

size_t write_sidecars(const std::vector<PageSource> &pages, const BatchResult &batch,
                      const config::Config &cfg, const fs::path &output_dir,
                      const std::string &run_id) {
  size_t written = 0;
  for (size_t i = 0; i < pages.size(); ++i) {
    auto it = batch.results.find(pages[i].id);
    if (it == batch.results.end()) continue;
    const ReviewDecision decision = evaluate_review(it->second, cfg.review);
    write_json_file(sidecar_output_path(output_dir, pages[i].id, cfg.output),
                    build_sidecar(pages[i], it->second, decision, i, run_id));
    ++written;
  }
  return written;
}

RunMetrics summarize_run(size_t pages_total, const BatchResult &batch,
                         const config::ReviewConfig &cfg) {
  RunMetrics m;
  m.pages_total = pages_total;
  m.normalized_pages = batch.results.size();
  m.failed_pages = batch.failures.size();

  double skew_sum = 0.0;
  double coverage_sum = 0.0;
  size_t shadows = 0;
  for (const auto &[id, r] : batch.results) {
    skew_sum += std::fabs(r.skew_angle);
    coverage_sum += r.stats.mask_coverage;
    if (r.shadow.present) ++shadows;
    if (r.stats.mask_coverage < cfg.min_mask_coverage) ++m.low_coverage_count;
    if (evaluate_review(r, cfg).accepted) ++m.accepted_pages;
  }

  const double n = static_cast<double>(std::max<size_t>(1, m.normalized_pages));
  m.avg_skew_deg = skew_sum / n;
  m.avg_mask_coverage = coverage_sum / n;
  m.shadow_rate = static_cast<double>(shadows) / n;
  return m;
}

std::vector<std::string> run_observations(const RunMetrics &m) {
  if (m.normalized_pages == 0) return {};
  return {"Average residual skew: " + fixed(m.avg_skew_deg, 2) + " deg",
          "Average mask coverage: " + fixed(m.avg_mask_coverage * 100.0, 1) + "%",
          "Shadow detection rate: " + fixed(m.shadow_rate * 100.0, 1) + "%"};
}

std::vector<std::string> run_recommendations(const RunMetrics &m) {
  std::vector<std::string> out;
  if (m.normalized_pages == 0) return out;
  if (m.low_coverage_count > 0) {
    out.push_back(std::to_string(m.low_coverage_count) +
                  " pages have low mask coverage; review crop padding or thresholding");
  }
  if (m.shadow_rate > 0.15) {
    out.push_back("Spine/edge shadows frequent; increase edge margin or shadow compensation");
  }
  if (m.avg_mask_coverage < 0.7) {
    out.push_back("Tight crops detected; increase padding or relax mask threshold");
  }
  return out;
}

json build_run_summary(const std::string &run_id, const RunMetrics &metrics,
                       const BatchResult &batch, double duration_ms,
                       const config::RunConfig &run) {
  json failures = json::array();
  for (const auto &f : batch.failures) {
    failures.push_back({{"pageId", f.page_id},
                        {"phase", f.phase},
                        {"kind", f.kind},
                        {"message", f.message}});
  }

  return {{"runId", run_id},
          {"status", batch.failures.empty() ? "success" : "partial"},
          {"pagesProcessed", metrics.pages_total},
          {"normalizedPages", metrics.normalized_pages},
          {"failedPages", metrics.failed_pages},
          {"acceptedPages", metrics.accepted_pages},
          {"durationMs", duration_ms},
          {"targetDpi", run.target_dpi},
          {"targetDimensionsMm",
           {{"width", run.target_width_mm}, {"height", run.target_height_mm}}},
          {"normalization",
           {{"avgSkewDeg", metrics.avg_skew_deg},
            {"avgMaskCoverage", metrics.avg_mask_coverage},
            {"shadowRate", metrics.shadow_rate},
            {"lowCoverageCount", metrics.low_coverage_count}}},
          {"observations", run_observations(metrics)},
          {"recommendations", run_recommendations(metrics)},
          {"errors", failures}};
}

} // namespace page_norm::pipeline
