#pragma once
#include "artifact_store.hpp"
#include "explainer.hpp"
#include "feature_expander.hpp"
#include "types.hpp"

namespace avf {

// Winsorize + log1p the four numeric variables; IJVC and sex pass through.
BaseFeatures preprocess(const RawInput& input, const WinsorLimits& limits);

// preprocess -> expand -> standardize -> score -> explain
PredictionResult predict(const RawInput& input, const ArtifactStore& store,
                         const LabelMap& labels = defaultLabelMap());

} // namespace avf
