#include "scaler.hpp"
#include "errors.hpp"

namespace avf {

ScaledFeatureVector standardize(const FeatureVector& features, const ScalerParams& params) {
    const std::size_t n = features.size();
    if (features.names.size() != n || params.mean.size() != n || params.scale.size() != n) {
        throw FeatureShapeError("Feature vector has " + std::to_string(n) + " values but scaler expects " +
                                std::to_string(params.mean.size()) + " means and " +
                                std::to_string(params.scale.size()) + " scales");
    }
    if (!params.features.empty()) {
        if (params.features.size() != n) {
            throw FeatureShapeError("Scaler names " + std::to_string(params.features.size()) +
                                    " features, vector has " + std::to_string(n));
        }
        for (std::size_t i = 0; i < n; ++i) {
            if (params.features[i] != features.names[i]) {
                throw FeatureShapeError("Scaler feature " + std::to_string(i) + " is '" + params.features[i] +
                                        "' but vector has '" + features.names[i] + "'");
            }
        }
    }

    ScaledFeatureVector out;
    out.names = features.names;
    out.values.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.values.push_back((features.values[i] - params.mean[i]) / params.scale[i]);
    }
    return out;
}

} // namespace avf
