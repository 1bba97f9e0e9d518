#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "types.hpp"

namespace avf {

using LabelMap = std::map<std::string, std::string>;

const LabelMap& defaultLabelMap();

// Per-feature coef[i] * scaled[i], sorted by |value| descending; ties keep
// feature order. The values plus the intercept sum to the linear predictor.
// Unmapped features are labelled with their raw name.
// Throws FeatureShapeError on length mismatch.
std::vector<Contribution> explain(const ScaledFeatureVector& scaled, const ModelParams& model,
                                  const LabelMap& labels = defaultLabelMap());

std::vector<Contribution> topContributions(const std::vector<Contribution>& ranked, std::size_t n);

} // namespace avf
