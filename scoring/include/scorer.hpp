#pragma once
#include "types.hpp"

namespace avf {

// Logistic function, evaluated on the branch that cannot overflow.
double sigmoid(double z);

// z = intercept + sum(coef[i] * scaled[i]). Throws FeatureShapeError on length mismatch.
double linearPredictor(const ScaledFeatureVector& scaled, const ModelParams& model);

double score(const ScaledFeatureVector& scaled, const ModelParams& model);

} // namespace avf
