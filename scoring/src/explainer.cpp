#include "explainer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace avf {

const LabelMap& defaultLabelMap() {
    static const LabelMap labels = {
        {"log_MLR", "MLR (Inflammation)"},
        {"log_CRP", "CRP (Inflammation)"},
        {"log_triglycerides", "Triglycerides (Lipids)"},
        {"log_NLR", "NLR (Inflammation)"},
        {"IJVC", "Hx of IJV Cannulation"},
        {"sex", "Sex"},
        {"log_MLR*log_CRP", "Interaction: MLR x CRP"},
        {"log_MLR*log_triglycerides", "Interaction: MLR x TG"},
        {"log_MLR*log_NLR", "Interaction: MLR x NLR"},
    };
    return labels;
}

std::vector<Contribution> explain(const ScaledFeatureVector& scaled, const ModelParams& model,
                                  const LabelMap& labels) {
    if (scaled.size() != model.coef.size() || scaled.names.size() != scaled.size()) {
        throw FeatureShapeError("Cannot explain " + std::to_string(scaled.size()) + " features with " +
                                std::to_string(model.coef.size()) + " coefficients");
    }

    std::vector<Contribution> out;
    out.reserve(scaled.size());
    for (std::size_t i = 0; i < scaled.size(); ++i) {
        const std::string& name = scaled.names[i];
        auto it = labels.find(name);
        out.push_back(Contribution{name, it != labels.end() ? it->second : name,
                                   model.coef[i] * scaled.values[i]});
    }
    std::stable_sort(out.begin(), out.end(), [](const Contribution& a, const Contribution& b) {
        return std::fabs(a.value) > std::fabs(b.value);
    });
    return out;
}

std::vector<Contribution> topContributions(const std::vector<Contribution>& ranked, std::size_t n) {
    const auto count = std::min(n, ranked.size());
    return std::vector<Contribution>(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(count));
}

} // namespace avf
