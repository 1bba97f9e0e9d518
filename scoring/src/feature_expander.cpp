#include "feature_expander.hpp"

namespace avf {

std::string interactionName(std::size_t a, std::size_t b) {
    return std::string(kBaseFeatureNames.at(a)) + kInteractionMarker + kBaseFeatureNames.at(b);
}

const std::vector<std::string>& canonicalFeatureNames() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> n;
        n.reserve(kFeatureCount);
        for (const char* base : kBaseFeatureNames) n.emplace_back(base);
        for (const auto& [a, b] : kInteractionPairs) n.push_back(interactionName(a, b));
        return n;
    }();
    return names;
}

FeatureVector expand(const BaseFeatures& base) {
    FeatureVector fv;
    fv.names = canonicalFeatureNames();
    fv.values.reserve(kFeatureCount);
    for (double v : base) fv.values.push_back(v);
    for (const auto& [a, b] : kInteractionPairs) fv.values.push_back(base[a] * base[b]);
    return fv;
}

} // namespace avf
