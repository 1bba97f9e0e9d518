#pragma once
#include <stdexcept>
#include <string>

namespace avf {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Required artifact missing or unparseable; halts startup.
struct FatalConfigurationError : Error {
    using Error::Error;
};

struct NumericDomainError : Error {
    using Error::Error;
};

// Feature vector and loaded scaler/model parameters disagree in length or order.
struct FeatureShapeError : Error {
    using Error::Error;
};

// Boundary input outside the plausible range, or an unparseable value.
struct ValidationError : Error {
    using Error::Error;
};

std::string errorKind(const Error& e);

} // namespace avf
