#include "log.hpp"
#include "artifact_store.hpp"
#include "batch_runner.hpp"
#include "cli_config.hpp"
#include "errors.hpp"
#include "input_validation.hpp"
#include "pipeline.hpp"
#include "report_io.hpp"
#include <string>

using namespace avf;

// Platform banner
#if defined(_WIN32)
  #define AVF_PLATFORM "windows"
#elif defined(__APPLE__)
  #define AVF_PLATFORM "macos"
#elif defined(__linux__)
  #define AVF_PLATFORM "linux"
#else
  #define AVF_PLATFORM "unknown"
#endif

// Single patient from flags, stats medians and fallbacks.
static void runSingle(const CliConfig& cfg, const ArtifactStore& store) {
  const RawInput in = resolveInput(cfg, store.stats());
  validateRawInput(in);
  Log::write(LogLevel::Info, "Input: MLR=%.3f CRP=%.2f TG=%.2f NLR=%.2f IJVC=%s sex=%s",
             in.mlr, in.crp, in.triglycerides, in.nlr,
             in.ijvc == 1 ? "yes" : "no", in.sex == 1 ? "male" : "female");

  const PredictionResult r = predict(in, store);
  Log::write(LogLevel::Info, "Risk probability: %.1f%% (%s risk) | z=%.4f",
             r.probability * 100.0, riskBand(r.probability), r.linear_predictor);

  if (cfg.quiet) return;
  for (const auto& c : topContributions(r.contributions, cfg.top)) {
    Log::write(LogLevel::Info, "  %-28s %+.4f  %s", c.label.c_str(), c.value,
               c.value > 0 ? "increases risk" : "decreases risk");
  }
}

int main(int argc, char** argv) {
  CliConfig CFG;
  try {
    CFG = parseArgs(argc, argv);
  } catch (const ValidationError& e) {
    Log::write(LogLevel::Error, "%s", e.what());
    return 1;
  }
  Log::setLevel(Log::parseLevel(CFG.log_level));
  const bool fileLog = Log::init(CFG.log_dir);
  Log::write(LogLevel::Info, "AVF Guardian starting | platform=%s | build=%s %s",
             AVF_PLATFORM, __DATE__, __TIME__);
  if (!fileLog) {
    Log::write(LogLevel::Warn, "Could not open a log file in '%s', logging to console only", CFG.log_dir.c_str());
  }
  for (const auto& a : CFG.unknown) {
    Log::write(LogLevel::Warn, "Ignoring unknown argument '%s'", a.c_str());
  }

  int rc = 0;
  try {
    const ArtifactStore store = ArtifactStore::load(artifactDirs(CFG));
    if (CFG.batch_path.empty()) runSingle(CFG, store);
    else rc = runBatch(CFG, store);
  } catch (const FatalConfigurationError& e) {
    Log::write(LogLevel::Error, "Startup failed: %s", e.what());
    rc = 1;
  } catch (const Error& e) {
    Log::write(LogLevel::Error, "Prediction failed (%s): %s", errorKind(e).c_str(), e.what());
    rc = 2;
  } catch (const std::exception& e) {
    Log::write(LogLevel::Error, "Unexpected failure: %s", e.what());
    rc = 1;
  }
  Log::shutdown();
  return rc;
}
