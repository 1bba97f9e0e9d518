#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <vector>
#include "types.hpp"

namespace avf {

// Column index of MLR, CRP, triglycerides, NLR, IJVC, sex in the input file.
struct PatientCsvLayout {
  std::array<std::size_t, 6> column{};
  std::size_t width{};
};

std::vector<std::string> splitCsvLine(const std::string& line);

// Header names are matched case-insensitively, in any order; extra columns are
// ignored, as is a leading UTF-8 BOM. Throws ValidationError if a required column is missing.
PatientCsvLayout parsePatientHeader(const std::string& line);

// Throws ValidationError on a short row or an unparseable value.
RawInput parsePatientRow(const PatientCsvLayout& layout, const std::string& line);

} // namespace avf
