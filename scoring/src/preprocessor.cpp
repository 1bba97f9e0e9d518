#include "preprocessor.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace avf {

std::string normalizeKey(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(s.begin(), s.end(), notSpace);
    auto last = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    std::string out = (first < last) ? std::string(first, last) : std::string();
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<WinsorBounds> findLimits(const WinsorLimits& limits, const std::string& variable) {
    const std::string key = normalizeKey(variable);
    for (const auto& [name, bounds] : limits) {
        if (normalizeKey(name) == key) return bounds;
    }
    return std::nullopt;
}

double clampAndTransform(double raw, const std::string& variable, const WinsorLimits& limits) {
    // NaN compares false both ways and would come out of the clamp as `lower`
    if (std::isnan(raw)) {
        throw NumericDomainError("log1p domain error for " + variable + ": value is NaN");
    }
    double v = raw;
    if (auto b = findLimits(limits, variable)) {
        v = std::max(b->lower, std::min(v, b->upper));
    }
    if (!std::isfinite(v) || v <= -1.0) {
        throw NumericDomainError("log1p domain error for " + variable + ": value " +
                                 std::to_string(v) + " must be finite and > -1");
    }
    return std::log1p(v);
}

} // namespace avf
