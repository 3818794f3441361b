#include "runner_pipeline.hpp"

#include "page_norm/io/raster_io.hpp"

#include <CLI/CLI.hpp>

#include <iostream>

namespace {

void print_usage() {
  std::cout
      << "Usage: page_norm_runner run --estimates <json> --runs-dir <dir>\n"
      << "                            (--input-dir <dir> | --pages <json>)\n"
      << "                            [--config <yaml>] [--run-id <id>]\n"
      << "                            [--sample-count N] [--target-dpi D] [--dry-run]"
      << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  page_norm::io::initialize_codecs(argv[0]);

  CLI::App app{"Page Geometry Normalization Runner"};

  RunCommandOptions opts;

  auto run_cmd = app.add_subcommand("run", "Normalize a batch of pages");
  run_cmd->add_option("--config", opts.config_path, "Path to config.yaml");
  auto input_opt =
      run_cmd->add_option("--input-dir", opts.input_dir, "Directory of page images");
  auto pages_opt =
      run_cmd->add_option("--pages", opts.pages_path, "Page source records (JSON)");
  input_opt->excludes(pages_opt);
  run_cmd->add_option("--estimates", opts.estimates_path, "Bounds estimates (JSON)");
  run_cmd->add_option("--runs-dir", opts.runs_dir, "Runs directory")->required();
  run_cmd->add_option("--run-id", opts.run_id, "Run id (default: generated)");
  run_cmd->add_option("--sample-count", opts.sample_count,
                      "Limit number of pages (0 = no limit)");
  run_cmd->add_option("--target-dpi", opts.target_dpi, "Fallback DPI override");
  run_cmd->add_flag("--dry-run", opts.dry_run, "Dry run");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_normalization_command(opts);
  }

  print_usage();
  return 1;
}
