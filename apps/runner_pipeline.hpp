#pragma once

#include <string>

struct RunCommandOptions {
  std::string config_path;
  std::string input_dir;
  std::string pages_path;
  std::string estimates_path;
  std::string runs_dir;
  std::string run_id;
  int sample_count = -1;     // < 0 keeps run.sample_count from the config
  double target_dpi = 0.0;   // <= 0 keeps run.target_dpi from the config
  bool dry_run = false;
};

int run_normalization_command(const RunCommandOptions &opts);
