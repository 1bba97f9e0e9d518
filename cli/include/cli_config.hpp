#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

namespace avf {

// Entry-form defaults when data_stats.json has no median for the variable.
constexpr double kFallbackMlr = 0.4;
constexpr double kFallbackCrp = 5.0;
constexpr double kFallbackTriglycerides = 1.5;
constexpr double kFallbackNlr = 3.0;
constexpr int kFallbackIjvc = 2;  // no cannulation history
constexpr int kFallbackSex = 1;   // male

struct CliConfig {
  bool quiet = false;                     // suppress per-factor lines
  std::string models_dir;                 // tried before the default directories
  std::string log_dir = "./logs";
  std::string log_level = "INFO";
  std::string batch_path;                 // empty: score a single patient
  std::string out_path = "data/predictions.csv";
  std::size_t top = 6;
  std::optional<double> mlr, crp, triglycerides, nlr;
  std::optional<int> ijvc, sex;
  std::vector<std::string> unknown;       // reported once logging is up
};

// --models=DIR --log-dir=DIR --log-level=L --batch=PATH --out=PATH --top=N --quiet
// --mlr= --crp= --tg= --nlr= --ijvc= --sex=
// AVF_LOG_DIR and AVF_LOG_LEVEL supply defaults. Throws ValidationError on a
// malformed value.
CliConfig parseArgs(int argc, char** argv);

// Candidate artifact directories: --models first, then defaultArtifactDirs().
std::vector<std::string> artifactDirs(const CliConfig& cfg);

// Explicit flags win, then the stats median, then the built-in fallback.
RawInput resolveInput(const CliConfig& cfg, const DescriptiveStats& stats);

// Whole-string numeric parse; throws ValidationError naming `field`.
double parseNumber(const std::string& text, const std::string& field);
// 1 or 2 (also accepts "1.0"/"2.0"); throws ValidationError otherwise.
int parseCode(const std::string& text, const std::string& field);

} // namespace avf
