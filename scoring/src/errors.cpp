#include "errors.hpp"

namespace avf {

std::string errorKind(const Error& e) {
    if (dynamic_cast<const FatalConfigurationError*>(&e)) return "configuration";
    if (dynamic_cast<const NumericDomainError*>(&e)) return "domain";
    if (dynamic_cast<const FeatureShapeError*>(&e)) return "shape";
    if (dynamic_cast<const ValidationError*>(&e)) return "validation";
    return "error";
}

} // namespace avf
