#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace avf {

// Six clinical variables for one patient. sex: 1 = male, 2 = female.
// ijvc: history of ipsilateral internal jugular vein cannulation, 1 = yes, 2 = no.
struct RawInput {
    double mlr{};            // monocyte-to-lymphocyte ratio
    double crp{};            // C-reactive protein, mg/L
    double triglycerides{};  // mmol/L
    double nlr{};            // neutrophil-to-lymphocyte ratio
    int ijvc{2};
    int sex{1};
};

struct WinsorBounds {
    double lower{};
    double upper{};
};

// Keyed by the variable name as written in the artifact; lookups are case-insensitive.
using WinsorLimits = std::map<std::string, WinsorBounds>;

struct ScalerParams {
    std::vector<std::string> features;  // empty when the artifact carries no names
    std::vector<double> mean;
    std::vector<double> scale;
};

struct ModelParams {
    std::vector<std::string> features;
    std::vector<double> coef;
    double intercept{};
};

using DescriptiveStats = std::map<std::string, std::map<std::string, double>>;

struct FeatureVector {
    std::vector<std::string> names;
    std::vector<double> values;
    std::size_t size() const { return values.size(); }
};

// Kept distinct from FeatureVector so an unscaled vector cannot reach the scorer.
struct ScaledFeatureVector {
    std::vector<std::string> names;
    std::vector<double> values;
    std::size_t size() const { return values.size(); }
};

struct Contribution {
    std::string feature;
    std::string label;
    double value{};
};

struct PredictionResult {
    double probability{};
    double linear_predictor{};
    std::vector<Contribution> contributions;  // sorted by |value| descending
};

} // namespace avf
