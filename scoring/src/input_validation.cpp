#include "input_validation.hpp"
#include "errors.hpp"
#include <cmath>
#include <string>

namespace avf {

namespace {

void checkRange(const InputRange& r, double value) {
    if (!std::isfinite(value) || value < r.min || value > r.max) {
        throw ValidationError(std::string(r.variable) + " = " + std::to_string(value) + " is outside [" +
                              std::to_string(r.min) + ", " + std::to_string(r.max) + "]");
    }
}

void checkCode(const char* variable, int code) {
    if (code != 1 && code != 2) {
        throw ValidationError(std::string(variable) + " must be 1 or 2, got " + std::to_string(code));
    }
}

} // namespace

void validateRawInput(const RawInput& input) {
    checkRange(kInputRanges[0], input.mlr);
    checkRange(kInputRanges[1], input.crp);
    checkRange(kInputRanges[2], input.triglycerides);
    checkRange(kInputRanges[3], input.nlr);
    checkCode("IJVC", input.ijvc);
    checkCode("sex", input.sex);
}

} // namespace avf
