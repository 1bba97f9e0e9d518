#include "pipeline.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "preprocessor.hpp"
#include "scaler.hpp"
#include "scorer.hpp"

namespace avf {

BaseFeatures preprocess(const RawInput& input, const WinsorLimits& limits) {
    BaseFeatures base{};
    base[kLogMlr]           = clampAndTransform(input.mlr, kVarMlr, limits);
    base[kLogCrp]           = clampAndTransform(input.crp, kVarCrp, limits);
    base[kLogTriglycerides] = clampAndTransform(input.triglycerides, kVarTriglycerides, limits);
    base[kLogNlr]           = clampAndTransform(input.nlr, kVarNlr, limits);
    base[kIjvc]             = static_cast<double>(input.ijvc);
    base[kSex]              = static_cast<double>(input.sex);
    return base;
}

PredictionResult predict(const RawInput& input, const ArtifactStore& store, const LabelMap& labels) {
    const BaseFeatures base = preprocess(input, store.winsorLimits());
    const FeatureVector features = expand(base);

    try {
        const ScaledFeatureVector scaled = standardize(features, store.scaler());
        PredictionResult result;
        result.linear_predictor = linearPredictor(scaled, store.model());
        result.probability = sigmoid(result.linear_predictor);
        result.contributions = explain(scaled, store.model(), labels);

        Log::write(LogLevel::Debug, "predict: z=%.6f p=%.6f (log_MLR=%.4f log_CRP=%.4f log_TG=%.4f log_NLR=%.4f)",
                   result.linear_predictor, result.probability,
                   base[kLogMlr], base[kLogCrp], base[kLogTriglycerides], base[kLogNlr]);
        return result;
    } catch (const FeatureShapeError& e) {
        Log::write(LogLevel::Error, "Feature/artifact shape mismatch (artifacts in '%s'): %s",
                   store.directory().c_str(), e.what());
        throw;
    }
}

} // namespace avf
