#pragma once
#include <string>
#include <vector>
#include "types.hpp"

namespace avf {

constexpr const char* kModelFile = "lr_model.json";
constexpr const char* kScalerFile = "scaler.json";
constexpr const char* kWinsorFile = "winsor_limits.json";
constexpr const char* kStatsFile = "data_stats.json";

// Trained model, scaler and winsor limits; read-only once loaded.
class ArtifactStore {
public:
    // Uses the first candidate that is an existing directory. Throws
    // FatalConfigurationError if none exists, if a required file is missing or
    // malformed, or if the model/scaler feature names are not the canonical
    // 21 features in order. A missing or malformed data_stats.json only logs.
    static ArtifactStore load(const std::vector<std::string>& candidates);

    const ModelParams& model() const { return model_; }
    const ScalerParams& scaler() const { return scaler_; }
    const WinsorLimits& winsorLimits() const { return winsor_; }
    const DescriptiveStats& stats() const { return stats_; }
    const std::string& directory() const { return dir_; }

private:
    ArtifactStore() = default;

    std::string dir_;
    ModelParams model_;
    ScalerParams scaler_;
    WinsorLimits winsor_;
    DescriptiveStats stats_;
};

// $AVF_MODELS_DIR (if set), then Models, ../Models, ../../Models.
std::vector<std::string> defaultArtifactDirs();

// Median ("50%", else "median") of `variable` from the stats, or `fallback`.
double defaultInputValue(const DescriptiveStats& stats, const std::string& variable, double fallback);

} // namespace avf
