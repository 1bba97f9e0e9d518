#include "artifact_store.hpp"
#include "errors.hpp"
#include "feature_expander.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace avf {

namespace {

json readJson(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw FatalConfigurationError("Could not open artifact file: " + path.string());
    }
    try {
        json j; f >> j;
        return j;
    } catch (const json::exception& e) {
        throw FatalConfigurationError("Could not parse " + path.string() + ": " + e.what());
    }
}

// sklearn exports coef_ as [[...]] and intercept_ as [x]; accept both shapes.
std::vector<double> readVector(const json& j) {
    if (j.is_array() && j.size() == 1 && j.front().is_array()) {
        return j.front().get<std::vector<double>>();
    }
    return j.get<std::vector<double>>();
}

double readScalar(const json& j) {
    if (j.is_array() && j.size() == 1) return j.front().get<double>();
    return j.get<double>();
}

void requireFinite(const std::vector<double>& v, const std::string& what) {
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (!std::isfinite(v[i])) {
            throw FatalConfigurationError(what + "[" + std::to_string(i) + "] is not finite");
        }
    }
}

void requireCanonicalNames(const std::vector<std::string>& names, const std::string& what) {
    const auto& expected = canonicalFeatureNames();
    if (names.size() != expected.size()) {
        throw FatalConfigurationError(what + " has " + std::to_string(names.size()) + " features, expected " +
                                      std::to_string(expected.size()));
    }
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] != expected[i]) {
            throw FatalConfigurationError(what + " feature " + std::to_string(i) + " is '" + names[i] +
                                          "', expected '" + expected[i] + "'");
        }
    }
}

ModelParams parseModel(const fs::path& path) {
    const json j = readJson(path);
    ModelParams m;
    try {
        m.features  = j.at("feature_names").get<std::vector<std::string>>();
        m.coef      = readVector(j.at("coef"));
        m.intercept = readScalar(j.at("intercept"));
    } catch (const json::exception& e) {
        throw FatalConfigurationError("Malformed model file " + path.string() + ": " + e.what());
    }

    requireCanonicalNames(m.features, "Model");
    if (m.coef.size() != m.features.size()) {
        throw FatalConfigurationError("Model has " + std::to_string(m.coef.size()) + " coefficients for " +
                                      std::to_string(m.features.size()) + " features");
    }
    requireFinite(m.coef, "coef");
    if (!std::isfinite(m.intercept)) {
        throw FatalConfigurationError("Model intercept is not finite");
    }
    return m;
}

ScalerParams parseScaler(const fs::path& path) {
    const json j = readJson(path);
    ScalerParams s;
    try {
        if (j.contains("feature_names")) {
            s.features = j.at("feature_names").get<std::vector<std::string>>();
        }
        s.mean  = readVector(j.at("mean"));
        s.scale = readVector(j.at("scale"));
    } catch (const json::exception& e) {
        throw FatalConfigurationError("Malformed scaler file " + path.string() + ": " + e.what());
    }

    if (s.mean.size() != kFeatureCount || s.scale.size() != kFeatureCount) {
        throw FatalConfigurationError("Scaler has " + std::to_string(s.mean.size()) + " means and " +
                                      std::to_string(s.scale.size()) + " scales, expected " +
                                      std::to_string(kFeatureCount));
    }
    if (!s.features.empty()) requireCanonicalNames(s.features, "Scaler");
    requireFinite(s.mean, "mean");
    requireFinite(s.scale, "scale");
    for (std::size_t i = 0; i < s.scale.size(); ++i) {
        if (s.scale[i] == 0.0) {
            throw FatalConfigurationError("scale[" + std::to_string(i) + "] is zero");
        }
    }
    return s;
}

WinsorLimits parseWinsor(const fs::path& path) {
    const json j = readJson(path);
    if (!j.is_object()) {
        throw FatalConfigurationError("Winsor limits file " + path.string() + " must hold an object");
    }
    WinsorLimits limits;
    for (const auto& [name, entry] : j.items()) {
        WinsorBounds b;
        try {
            b.lower = entry.at("lower").get<double>();
            b.upper = entry.at("upper").get<double>();
        } catch (const json::exception& e) {
            throw FatalConfigurationError("Malformed winsor limits for '" + name + "': " + e.what());
        }
        if (!std::isfinite(b.lower) || !std::isfinite(b.upper) || b.lower > b.upper) {
            throw FatalConfigurationError("Invalid winsor bounds for '" + name + "'");
        }
        limits.emplace(name, b);
    }
    return limits;
}

DescriptiveStats parseStats(const fs::path& path) {
    DescriptiveStats stats;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        Log::write(LogLevel::Info, "No %s in artifact directory, using built-in input defaults", kStatsFile);
        return stats;
    }
    try {
        const json j = readJson(path);
        for (const auto& [name, entry] : j.items()) {
            if (!entry.is_object()) continue;
            for (const auto& [stat, value] : entry.items()) {
                if (value.is_number()) stats[name][stat] = value.get<double>();
            }
        }
    } catch (const std::exception& e) {
        Log::write(LogLevel::Warn, "Ignoring unreadable %s: %s", path.string().c_str(), e.what());
        stats.clear();
    }
    return stats;
}

} // namespace

ArtifactStore ArtifactStore::load(const std::vector<std::string>& candidates) {
    std::string chosen;
    for (const auto& c : candidates) {
        std::error_code ec;
        if (!c.empty() && fs::is_directory(c, ec)) { chosen = c; break; }
    }
    if (chosen.empty()) {
        std::string tried;
        for (const auto& c : candidates) tried += (tried.empty() ? "" : ", ") + c;
        throw FatalConfigurationError("Model files not found, tried: " + (tried.empty() ? "<none>" : tried));
    }

    const fs::path base(chosen);
    ArtifactStore store;
    store.dir_    = chosen;
    store.model_  = parseModel(base / kModelFile);
    store.scaler_ = parseScaler(base / kScalerFile);
    store.winsor_ = parseWinsor(base / kWinsorFile);
    store.stats_  = parseStats(base / kStatsFile);

    Log::write(LogLevel::Info, "Loaded artifacts from '%s' | features=%zu winsor_vars=%zu stats_vars=%zu",
               chosen.c_str(), store.model_.features.size(), store.winsor_.size(), store.stats_.size());
    return store;
}

std::vector<std::string> defaultArtifactDirs() {
    std::vector<std::string> dirs;
    if (const char* env = std::getenv("AVF_MODELS_DIR"); env && *env) dirs.emplace_back(env);
    dirs.emplace_back("Models");        // run from repo root
    dirs.emplace_back("../Models");     // run from build/
    dirs.emplace_back("../../Models");  // run from build/cli/
    return dirs;
}

double defaultInputValue(const DescriptiveStats& stats, const std::string& variable, double fallback) {
    auto it = stats.find(variable);
    if (it == stats.end()) return fallback;
    for (const char* key : {"50%", "median"}) {
        auto s = it->second.find(key);
        if (s != it->second.end() && std::isfinite(s->second)) return s->second;
    }
    return fallback;
}

} // namespace avf
