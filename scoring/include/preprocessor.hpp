#pragma once
#include <optional>
#include <string>
#include "types.hpp"

namespace avf {

constexpr const char* kVarMlr = "MLR";
constexpr const char* kVarCrp = "CRP";
constexpr const char* kVarTriglycerides = "triglycerides";
constexpr const char* kVarNlr = "NLR";
constexpr const char* kVarIjvc = "IJVC";
constexpr const char* kVarSex = "sex";

std::string normalizeKey(const std::string& s);

std::optional<WinsorBounds> findLimits(const WinsorLimits& limits, const std::string& variable);

// Clamp to the variable's winsor bounds (if any), then log1p.
// Throws NumericDomainError for NaN input, or when the clamped value is
// infinite or <= -1.
double clampAndTransform(double raw, const std::string& variable, const WinsorLimits& limits);

} // namespace avf
