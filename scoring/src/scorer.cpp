#include "scorer.hpp"
#include "errors.hpp"
#include <cmath>

namespace avf {

double sigmoid(double z) {
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double ez = std::exp(z);
    return ez / (1.0 + ez);
}

double linearPredictor(const ScaledFeatureVector& scaled, const ModelParams& model) {
    if (scaled.size() != model.coef.size()) {
        throw FeatureShapeError("Feature vector size " + std::to_string(scaled.size()) +
                                " does not match model size " + std::to_string(model.coef.size()));
    }
    double z = model.intercept;
    for (std::size_t i = 0; i < model.coef.size(); ++i) {
        z += model.coef[i] * scaled.values[i];
    }
    return z;
}

double score(const ScaledFeatureVector& scaled, const ModelParams& model) {
    return sigmoid(linearPredictor(scaled, model));
}

} // namespace avf
