#include "page_norm/pipeline/normalize_page.hpp"
#include "page_norm/core/errors.hpp"
#include "page_norm/geometry/physical_size.hpp"
#include "page_norm/image/background.hpp"
#include "page_norm/image/crop.hpp"
#include "page_norm/image/deskew.hpp"
#include "page_norm/image/shadow.hpp"
#include "page_norm/io/raster_io.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>

namespace page_norm::pipeline {

namespace {

void set_stage(std::string *stage, const char *name) {
  if (stage) *stage = name;
}

void ensure_writable_dir(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec || !fs::is_directory(dir)) {
    throw OutputError("Cannot create directory " + dir.string() +
                      (ec ? ": " + ec.message() : std::string()));
  }

  const fs::path probe = dir / ".write_probe";
  {
    std::ofstream out(probe, std::ios::out | std::ios::trunc);
    if (!out || !(out << "ok")) {
      throw OutputError("Directory not writable: " + dir.string());
    }
  }
  fs::remove(probe, ec);
}

} // namespace

fs::path normalized_output_path(const fs::path &output_dir, const std::string &page_id,
                                const config::OutputConfig &cfg) {
  return output_dir / cfg.normalized_dir / (page_id + io::output_extension(cfg));
}

void prepare_output_dirs(const fs::path &output_dir, const config::OutputConfig &cfg) {
  ensure_writable_dir(output_dir / cfg.normalized_dir);
  if (cfg.write_sidecars) {
    ensure_writable_dir(output_dir / cfg.sidecars_dir);
  }
  ensure_writable_dir(output_dir / cfg.artifacts_dir);
}

PreviewAnalysis analyze_preview(const PreviewRaster &preview, const config::Config &cfg,
                                std::string *stage) {
  if (preview.width() < 3 || preview.height() < 3) {
    throw ComputationError("preview too small: " + std::to_string(preview.width()) + "x" +
                           std::to_string(preview.height()));
  }

  PreviewAnalysis a;

  set_stage(stage, "deskew");
  a.skew = image::estimate_skew(preview, cfg.deskew);
  a.deskewed = image::deskew_preview(preview.pixels, a.skew.angle_deg);

  set_stage(stage, "background");
  a.gradients = image::compute_gradients(a.deskewed);
  a.border = image::compute_border_stats(a.deskewed, cfg.background);

  set_stage(stage, "shadow");
  a.shadow = image::detect_shadow(a.deskewed, cfg.shadow);

  set_stage(stage, "bounds");
  const image::BoundsContext ctx{a.deskewed, a.gradients, a.border, a.shadow, cfg};
  a.bounds = image::estimate_bounds(ctx);
  return a;
}

NormalizationResult normalize_page(const PageSource &page, const BoundsEstimate *estimate,
                                   const config::Config &cfg, const fs::path &output_dir,
                                   std::string *stage) {
  const auto t0 = std::chrono::steady_clock::now();

  set_stage(stage, "lookup_estimate");
  if (!estimate) {
    throw MissingEstimateError(page.id);
  }

  set_stage(stage, "decode");
  io::SourceRaster src = io::load_source_raster(page.path);
  const std::optional<double> density = src.density ? src.density : page.density;

  set_stage(stage, "physical_size");
  const PhysicalSize physical = geometry::infer_physical_size(
      src.width, src.height, density, cfg.run.target_dpi, cfg.physical_size);

  set_stage(stage, "preview");
  const PreviewRaster preview = io::make_preview(src.pixels, cfg.preview.max_dim);

  const PreviewAnalysis analysis = analyze_preview(preview, cfg, stage);

  set_stage(stage, "crop");
  const Box crop = image::rescale_box(analysis.bounds.expanded_box, preview.width(),
                                      preview.height(), src.width, src.height);
  const Box mask = image::rescale_box(analysis.bounds.mask_box, preview.width(),
                                      preview.height(), src.width, src.height);
  cv::Mat cropped = image::compose_crop(src.pixels, analysis.skew.angle_deg, crop);

  set_stage(stage, "encode");
  const fs::path out_path = normalized_output_path(output_dir, page.id, cfg.output);
  io::write_raster_with_dpi(out_path, cropped, physical.dpi, cfg.output);

  NormalizationResult r;
  r.page_id = page.id;
  r.normalized_path = out_path;
  r.crop_box = crop;
  r.mask_box = mask;
  r.source_width_px = src.width;
  r.source_height_px = src.height;
  r.width_mm = physical.width_mm;
  r.height_mm = physical.height_mm;
  r.dpi = physical.dpi;
  r.dpi_source = physical.source;
  r.trim_mm = geometry::px_to_mm(estimate->trim_px, physical.dpi);
  r.bleed_mm = geometry::px_to_mm(estimate->bleed_px, physical.dpi);
  r.skew_angle = analysis.skew.angle_deg;
  r.shadow = analysis.shadow;
  if (r.shadow.width_px > 0 && preview.scale > 0.0) {
    r.shadow.width_px = static_cast<int>(std::lround(r.shadow.width_px / preview.scale));
  }
  r.stats.background_mean = analysis.border.mean;
  r.stats.background_std = analysis.border.std;
  r.stats.mask_coverage = analysis.bounds.mask_coverage;
  r.stats.skew_confidence = analysis.skew.confidence;
  r.stats.shadow_score = analysis.shadow.darkness;
  r.processing_ms = std::chrono::duration<double, std::milli>(
                        std::chrono::steady_clock::now() - t0).count();
  return r;
}

BatchResult normalize_pages(const std::vector<PageSource> &pages,
                            const std::map<std::string, BoundsEstimate> &estimates,
                            const config::Config &cfg, const fs::path &output_dir,
                            const PageObserver &observer) {
  BatchResult batch;
  if (pages.empty()) return batch;

  std::set<std::string> ids;
  for (const auto &page : pages) {
    if (!ids.insert(page.id).second) {
      throw ValidationError("duplicate page id '" + page.id + "' in batch");
    }
  }

  prepare_output_dirs(output_dir, cfg.output);

  int workers = cfg.runtime_limits.parallel_workers;
  int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
  if (cpu_cores == 0)
    cpu_cores = 1;
  if (workers > cpu_cores) {
    std::cout << "[WARNING] parallel_workers (" << workers << ") exceeds CPU cores ("
              << cpu_cores << "), capping to " << cpu_cores << std::endl;
    workers = cpu_cores;
  }
  workers = std::max(1, std::min<int>(workers, static_cast<int>(pages.size())));

  std::mutex result_mutex;
  std::atomic<size_t> next_page{0};
  std::atomic<bool> stop{false};
  std::exception_ptr fatal;

  auto record_failure = [&](size_t idx, const std::string &stage, const std::string &kind,
                            const std::string &message) {
    PageFailure f{pages[idx].id, stage, kind, message};
    {
      std::lock_guard<std::mutex> lock(result_mutex);
      batch.failures.push_back(f);
    }
    if (observer) observer(idx, nullptr, &f);
  };

  auto process_page = [&](size_t idx) {
    const PageSource &page = pages[idx];
    auto it = estimates.find(page.id);
    const BoundsEstimate *estimate = it != estimates.end() ? &it->second : nullptr;
    std::string stage;
    const NormalizationResult *done = nullptr;
    try {
      NormalizationResult r = normalize_page(page, estimate, cfg, output_dir, &stage);
      std::lock_guard<std::mutex> lock(result_mutex);
      auto &slot = batch.results[page.id];
      slot = std::move(r);
      done = &slot;
    } catch (const OutputError &) {
      std::lock_guard<std::mutex> lock(result_mutex);
      if (!fatal) fatal = std::current_exception();
      stop.store(true);
    } catch (const PageNormError &e) {
      record_failure(idx, stage, error_kind(e), e.what());
    } catch (const cv::Exception &e) {
      record_failure(idx, stage, "ComputationError", e.what());
    } catch (const std::exception &e) {
      record_failure(idx, stage, "Error", e.what());
    }
    // map nodes stay put while other workers insert
    if (done && observer) observer(idx, done, nullptr);
  };

  const int prev_cv_threads = cv::getNumThreads();
  cv::setNumThreads(1);

  std::cout << "[NORMALIZATION] Using " << workers << " parallel workers for "
            << pages.size() << " pages" << std::endl;

  if (workers > 1) {
    std::vector<std::thread> pool;
    for (int w = 0; w < workers; ++w) {
      pool.emplace_back([&]() {
        while (!stop.load()) {
          size_t idx = next_page.fetch_add(1);
          if (idx >= pages.size())
            break;
          process_page(idx);
        }
      });
    }
    for (auto &t : pool) {
      t.join();
    }
  } else {
    for (size_t idx = 0; idx < pages.size() && !stop.load(); ++idx) {
      process_page(idx);
    }
  }

  cv::setNumThreads(prev_cv_threads);

  if (fatal) {
    std::rethrow_exception(fatal);
  }

  std::sort(batch.failures.begin(), batch.failures.end(),
            [](const PageFailure &a, const PageFailure &b) { return a.page_id < b.page_id; });
  return batch;
}

} // namespace page_norm::pipeline
