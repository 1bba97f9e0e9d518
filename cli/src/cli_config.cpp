#include "cli_config.hpp"
#include "artifact_store.hpp"
#include "errors.hpp"
#include "feature_expander.hpp"
#include "preprocessor.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace avf {

double parseNumber(const std::string& text, const std::string& field) {
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(text, &used);
  } catch (const std::exception&) {
    throw ValidationError("Invalid number for " + field + ": '" + text + "'");
  }
  while (used < text.size() && std::isspace(static_cast<unsigned char>(text[used]))) ++used;
  if (used != text.size()) {
    throw ValidationError("Invalid number for " + field + ": '" + text + "'");
  }
  return v;
}

int parseCode(const std::string& text, const std::string& field) {
  const double v = parseNumber(text, field);
  if (v != 1.0 && v != 2.0) {
    throw ValidationError(field + " must be 1 or 2, got '" + text + "'");
  }
  return static_cast<int>(v);
}

CliConfig parseArgs(int argc, char** argv) {
  CliConfig cfg;
  if (const char* d = std::getenv("AVF_LOG_DIR"); d && *d) cfg.log_dir = d;
  if (const char* l = std::getenv("AVF_LOG_LEVEL"); l && *l) cfg.log_level = l;

  for (int i=1; i<argc; ++i) {
    std::string a = argv[i];
    auto value = [&](const char* prefix) -> std::optional<std::string> {
      const std::string p(prefix);
      if (a.rfind(p, 0) == 0) return a.substr(p.size());
      return std::nullopt;
    };

    if (a == "--quiet") cfg.quiet = true;
    else if (auto v = value("--models=")) cfg.models_dir = *v;
    else if (auto v = value("--log-dir=")) cfg.log_dir = *v;
    else if (auto v = value("--log-level=")) cfg.log_level = *v;
    else if (auto v = value("--batch=")) cfg.batch_path = *v;
    else if (auto v = value("--out=")) cfg.out_path = *v;
    else if (auto v = value("--top=")) {
      const double n = parseNumber(*v, "--top");
      if (!std::isfinite(n) || n < 0 || n != std::floor(n) || n > static_cast<double>(kFeatureCount)) {
        throw ValidationError("--top must be an integer from 0 to " + std::to_string(kFeatureCount));
      }
      cfg.top = static_cast<std::size_t>(n);
    }
    else if (auto v = value("--mlr=")) cfg.mlr = parseNumber(*v, kVarMlr);
    else if (auto v = value("--crp=")) cfg.crp = parseNumber(*v, kVarCrp);
    else if (auto v = value("--tg=")) cfg.triglycerides = parseNumber(*v, kVarTriglycerides);
    else if (auto v = value("--nlr=")) cfg.nlr = parseNumber(*v, kVarNlr);
    else if (auto v = value("--ijvc=")) cfg.ijvc = parseCode(*v, kVarIjvc);
    else if (auto v = value("--sex=")) cfg.sex = parseCode(*v, kVarSex);
    else cfg.unknown.push_back(a);
  }
  return cfg;
}

std::vector<std::string> artifactDirs(const CliConfig& cfg) {
  std::vector<std::string> dirs;
  if (!cfg.models_dir.empty()) dirs.push_back(cfg.models_dir);
  for (auto& d : defaultArtifactDirs()) dirs.push_back(std::move(d));
  return dirs;
}

RawInput resolveInput(const CliConfig& cfg, const DescriptiveStats& stats) {
  RawInput in;
  in.mlr = cfg.mlr.value_or(defaultInputValue(stats, kVarMlr, kFallbackMlr));
  in.crp = cfg.crp.value_or(defaultInputValue(stats, kVarCrp, kFallbackCrp));
  in.triglycerides = cfg.triglycerides.value_or(defaultInputValue(stats, kVarTriglycerides, kFallbackTriglycerides));
  in.nlr = cfg.nlr.value_or(defaultInputValue(stats, kVarNlr, kFallbackNlr));
  in.ijvc = cfg.ijvc.value_or(kFallbackIjvc);
  in.sex = cfg.sex.value_or(kFallbackSex);
  return in;
}

} // namespace avf
