#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"

namespace avf {

constexpr std::size_t kBaseFeatureCount = 6;
constexpr std::size_t kInteractionCount = kBaseFeatureCount * (kBaseFeatureCount - 1) / 2;
constexpr std::size_t kFeatureCount = kBaseFeatureCount + kInteractionCount;

// Index into BaseFeatures. The order is the training-time column order.
enum BaseFeature : std::size_t {
    kLogMlr = 0,
    kLogCrp,
    kLogTriglycerides,
    kLogNlr,
    kIjvc,
    kSex,
};

using BaseFeatures = std::array<double, kBaseFeatureCount>;

constexpr std::array<const char*, kBaseFeatureCount> kBaseFeatureNames = {
    "log_MLR", "log_CRP", "log_triglycerides", "log_NLR", "IJVC", "sex",
};

// Interaction columns as fitted: every unordered pair of base features, first
// with each later one, then second with each later one, and so on. Written out
// rather than generated so a reorder shows up in review and in the tests.
constexpr std::array<std::pair<std::size_t, std::size_t>, kInteractionCount> kInteractionPairs = {{
    {kLogMlr, kLogCrp},
    {kLogMlr, kLogTriglycerides},
    {kLogMlr, kLogNlr},
    {kLogMlr, kIjvc},
    {kLogMlr, kSex},
    {kLogCrp, kLogTriglycerides},
    {kLogCrp, kLogNlr},
    {kLogCrp, kIjvc},
    {kLogCrp, kSex},
    {kLogTriglycerides, kLogNlr},
    {kLogTriglycerides, kIjvc},
    {kLogTriglycerides, kSex},
    {kLogNlr, kIjvc},
    {kLogNlr, kSex},
    {kIjvc, kSex},
}};

constexpr const char* kInteractionMarker = "*";

std::string interactionName(std::size_t a, std::size_t b);

const std::vector<std::string>& canonicalFeatureNames();

// Main effects followed by the 15 pairwise products.
FeatureVector expand(const BaseFeatures& base);

} // namespace avf
