#pragma once
#include <array>
#include "types.hpp"

namespace avf {

struct InputRange {
    const char* variable;
    double min;
    double max;
};

// Plausible ranges accepted by the entry form. The scoring pipeline does not
// enforce these; outliers inside them are handled by winsorization.
constexpr std::array<InputRange, 4> kInputRanges = {{
    {"MLR", 0.0, 10.0},
    {"CRP", 0.0, 200.0},
    {"triglycerides", 0.0, 20.0},
    {"NLR", 0.0, 50.0},
}};

void validateRawInput(const RawInput& input);

} // namespace avf
