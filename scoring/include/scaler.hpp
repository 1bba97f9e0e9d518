#pragma once
#include "types.hpp"

namespace avf {

// scaled[i] = (x[i] - mean[i]) / scale[i].
// Throws FeatureShapeError if the lengths differ, or if the scaler carries
// feature names that do not match the vector position by position.
ScaledFeatureVector standardize(const FeatureVector& features, const ScalerParams& params);

} // namespace avf
