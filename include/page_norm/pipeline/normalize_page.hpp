#pragma once

#include "page_norm/config/configuration.hpp"
#include "page_norm/core/types.hpp"
#include "page_norm/image/bounds.hpp"
#include "page_norm/image/processing.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace page_norm::pipeline {

// Everything measured on the preview before the full raster is touched.
struct PreviewAnalysis {
  SkewEstimate skew;
  Matrix2Df deskewed;
  image::GradientField gradients;
  BorderStats border;
  ShadowDetection shadow;
  image::BoundsRecord bounds;
};

struct BatchResult {
  std::map<std::string, NormalizationResult> results;
  std::vector<PageFailure> failures;
};

// Called once per page as it finishes, concurrently from worker threads.
// Exactly one of result/failure is set.
using PageObserver = std::function<void(size_t index, const NormalizationResult *result,
                                        const PageFailure *failure)>;

fs::path normalized_output_path(const fs::path &output_dir, const std::string &page_id,
                                const config::OutputConfig &cfg);

// Creates the output subdirectories and checks they accept writes. Throws OutputError.
void prepare_output_dirs(const fs::path &output_dir, const config::OutputConfig &cfg);

// stage, when given, tracks the step in progress so failures can name it.
PreviewAnalysis analyze_preview(const PreviewRaster &preview, const config::Config &cfg,
                                std::string *stage = nullptr);

// Throws MissingEstimateError when estimate is null, DecodeError,
// ComputationError, or OutputError.
NormalizationResult normalize_page(const PageSource &page, const BoundsEstimate *estimate,
                                   const config::Config &cfg, const fs::path &output_dir,
                                   std::string *stage = nullptr);

// Pages run on runtime_limits.parallel_workers threads. Duplicate page ids raise
// ValidationError before any work starts. Page-level failures are
// collected; an OutputError stops the batch and is rethrown after all workers join.
BatchResult normalize_pages(const std::vector<PageSource> &pages,
                            const std::map<std::string, BoundsEstimate> &estimates,
                            const config::Config &cfg, const fs::path &output_dir,
                            const PageObserver &observer = {});

} // namespace page_norm::pipeline
