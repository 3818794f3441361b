#include "runner_pipeline.hpp"
#include "runner_shared.hpp"

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/core/events.hpp"
#include "page_norm/core/types.hpp"
#include "page_norm/core/utils.hpp"
#include "page_norm/io/corpus_io.hpp"
#include "page_norm/pipeline/normalize_page.hpp"
#include "page_norm/pipeline/review.hpp"
#include "page_norm/pipeline/sidecar.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <vector>

namespace fs = std::filesystem;

using page_norm::runner::TeeBuf;

int run_normalization_command(const RunCommandOptions &opts) {
  using namespace page_norm;
  namespace pipeline = page_norm::pipeline;

  const auto t_start = std::chrono::steady_clock::now();

  config::Config cfg;
  try {
    if (!opts.config_path.empty()) {
      cfg = config::Config::load(opts.config_path);
    }
    if (opts.sample_count >= 0) cfg.run.sample_count = opts.sample_count;
    if (opts.target_dpi > 0.0) cfg.run.target_dpi = static_cast<float>(opts.target_dpi);
    cfg.validate();
  } catch (const PageNormError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::vector<PageSource> pages;
  try {
    if (!opts.pages_path.empty()) {
      pages = io::load_page_sources(opts.pages_path);
    } else if (!opts.input_dir.empty()) {
      if (!fs::is_directory(opts.input_dir)) {
        std::cerr << "Error: Input directory not found: " << opts.input_dir << std::endl;
        return 1;
      }
      pages = io::discover_page_sources(opts.input_dir, true);
    } else {
      std::cerr << "Error: one of --pages or --input-dir is required" << std::endl;
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const size_t discovered = pages.size();
  if (cfg.run.sample_count > 0 && pages.size() > static_cast<size_t>(cfg.run.sample_count)) {
    pages.resize(static_cast<size_t>(cfg.run.sample_count));
  }
  if (pages.empty()) {
    std::cerr << "Error: No page images found" << std::endl;
    return 1;
  }

  const std::string run_id = opts.run_id.empty() ? core::get_run_id() : opts.run_id;
  const fs::path run_dir = fs::absolute(fs::path(opts.runs_dir) / run_id);
  try {
    fs::create_directories(run_dir / "logs");
    pipeline::prepare_output_dirs(run_dir, cfg.output);
    if (!opts.config_path.empty()) {
      core::copy_config(opts.config_path, run_dir / "config.yaml");
    } else {
      cfg.save(run_dir / "config.yaml");
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: cannot prepare run directory " << run_dir << ": " << e.what()
              << std::endl;
    return 1;
  }

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl",
                               std::ios::out | std::ios::trunc);
  if (!event_log_file.is_open()) {
    std::cerr << "Error: cannot open events log file: "
              << (run_dir / "logs" / "run_events.jsonl") << std::endl;
    return 1;
  }
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", opts.config_path},
                     {"input_dir", opts.input_dir},
                     {"pages_path", opts.pages_path},
                     {"estimates_path", opts.estimates_path},
                     {"run_dir", run_dir.string()},
                     {"pages_discovered", discovered},
                     {"pages_selected", pages.size()},
                     {"target_dpi", cfg.run.target_dpi},
                     {"dry_run", opts.dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Pages: " << pages.size() << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  emitter.phase_start(run_id, Phase::SCAN_INPUT, "SCAN_INPUT", log_file);
  emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                    {{"pages", pages.size()}, {"discovered", discovered}}, log_file);

  if (opts.dry_run) {
    emitter.phase_start(run_id, Phase::NORMALIZATION, "NORMALIZATION", log_file);
    emitter.phase_end(run_id, Phase::NORMALIZATION, "skipped", {{"reason", "dry_run"}},
                      log_file);
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", {}, log_file);
    return 0;
  }

  // LOAD_ESTIMATES
  emitter.phase_start(run_id, Phase::LOAD_ESTIMATES, "LOAD_ESTIMATES", log_file);
  std::map<std::string, BoundsEstimate> estimates;
  try {
    if (opts.estimates_path.empty()) {
      throw ValidationError("--estimates is required for a normalization run");
    }
    estimates = io::load_bounds_estimates(opts.estimates_path);
  } catch (const std::exception &e) {
    emitter.phase_end(run_id, Phase::LOAD_ESTIMATES, "error", {{"error", e.what()}}, log_file);
    emitter.run_end(run_id, false, "error", {}, log_file);
    std::cerr << "Error during LOAD_ESTIMATES: " << e.what() << std::endl;
    return 1;
  }
  size_t matched = 0;
  for (const auto &p : pages) {
    if (estimates.count(p.id)) ++matched;
  }
  if (matched < pages.size()) {
    emitter.warning(run_id,
                    std::to_string(pages.size() - matched) +
                        " page(s) have no bounds estimate and will be skipped",
                    log_file);
  }
  emitter.phase_end(run_id, Phase::LOAD_ESTIMATES, "ok",
                    {{"estimates", estimates.size()}, {"matched", matched}}, log_file);

  // NORMALIZATION
  emitter.phase_start(run_id, Phase::NORMALIZATION, "NORMALIZATION", log_file);
  pipeline::BatchResult batch;
  const int total = static_cast<int>(pages.size());
  auto observer = [&](size_t idx, const NormalizationResult *result,
                      const PageFailure *failure) {
    if (result) {
      const auto decision = pipeline::evaluate_review(*result, cfg.review);
      emitter.page_processed(run_id, static_cast<int>(idx), total, *result, decision.accepted,
                             log_file);
    } else if (failure) {
      emitter.page_failed(run_id, *failure, log_file);
    }
  };
  try {
    batch = pipeline::normalize_pages(pages, estimates, cfg, run_dir, observer);
  } catch (const OutputError &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.phase_end(run_id, Phase::NORMALIZATION, "error", {{"error", e.what()}}, log_file);
    emitter.run_end(run_id, false, "output_error", {}, log_file);
    std::cerr << "Error during NORMALIZATION: " << e.what() << std::endl;
    return 1;
  } catch (const ValidationError &e) {
    emitter.phase_end(run_id, Phase::NORMALIZATION, "error", {{"error", e.what()}}, log_file);
    emitter.run_end(run_id, false, "error", {}, log_file);
    std::cerr << "Error during NORMALIZATION: " << e.what() << std::endl;
    return 1;
  }
  emitter.phase_end(run_id, Phase::NORMALIZATION, "ok",
                    {{"normalized", batch.results.size()}, {"failed", batch.failures.size()}},
                    log_file);
  std::cout << "[NORMALIZATION] Normalized " << batch.results.size() << " pages ("
            << batch.failures.size() << " failed)" << std::endl;

  // SIDECARS
  emitter.phase_start(run_id, Phase::SIDECARS, "SIDECARS", log_file);
  const pipeline::RunMetrics metrics = pipeline::summarize_run(pages.size(), batch, cfg.review);
  core::json summary;
  try {
    size_t written = 0;
    if (cfg.output.write_sidecars) {
      written = pipeline::write_sidecars(pages, batch, cfg, run_dir, run_id);
    }
    const double duration_ms = std::chrono::duration<double, std::milli>(
                                   std::chrono::steady_clock::now() - t_start).count();
    summary = pipeline::build_run_summary(run_id, metrics, batch, duration_ms, cfg.run);
    pipeline::write_json_file(run_dir / cfg.output.artifacts_dir / "normalization_summary.json",
                              summary);
    emitter.phase_end(run_id, Phase::SIDECARS, cfg.output.write_sidecars ? "ok" : "skipped",
                      {{"sidecars_written", written}}, log_file);
  } catch (const OutputError &e) {
    emitter.phase_end(run_id, Phase::SIDECARS, "error", {{"error", e.what()}}, log_file);
    emitter.run_end(run_id, false, "output_error", {}, log_file);
    std::cerr << "Error during SIDECARS: " << e.what() << std::endl;
    return 1;
  }

  emitter.phase_start(run_id, Phase::DONE, "DONE", log_file);
  emitter.phase_end(run_id, Phase::DONE, "ok", {}, log_file);
  emitter.run_end(run_id, true, batch.failures.empty() ? "ok" : "partial",
                  {{"summary", summary.at("normalization")},
                   {"normalized", metrics.normalized_pages},
                   {"failed", metrics.failed_pages},
                   {"accepted", metrics.accepted_pages}},
                  log_file);

  std::cout << "Normalization completed" << std::endl;
  return 0;
}
