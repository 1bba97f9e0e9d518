#include "patient_csv.hpp"
#include "cli_config.hpp"
#include "errors.hpp"
#include "preprocessor.hpp"

namespace avf {

namespace {

constexpr std::array<const char*, 6> kColumns = {
  kVarMlr, kVarCrp, kVarTriglycerides, kVarNlr, kVarIjvc, kVarSex,
};

} // namespace

std::vector<std::string> splitCsvLine(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i+1] == '"') { cur += '"'; ++i; }
      else if (c == '"') quoted = false;
      else cur += c;
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      out.push_back(cur); cur.clear();
    } else if (c != '\r') {
      cur += c;
    }
  }
  out.push_back(cur);
  return out;
}

PatientCsvLayout parsePatientHeader(const std::string& line) {
  static const std::string kUtf8Bom = "\xEF\xBB\xBF";
  const bool bom = line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0;
  const auto names = splitCsvLine(bom ? line.substr(kUtf8Bom.size()) : line);
  PatientCsvLayout layout;
  layout.width = names.size();
  for (std::size_t c = 0; c < kColumns.size(); ++c) {
    const std::string want = normalizeKey(kColumns[c]);
    bool found = false;
    for (std::size_t i = 0; i < names.size(); ++i) {
      if (normalizeKey(names[i]) == want) { layout.column[c] = i; found = true; break; }
    }
    if (!found) {
      throw ValidationError(std::string("Patient CSV has no '") + kColumns[c] + "' column");
    }
  }
  return layout;
}

RawInput parsePatientRow(const PatientCsvLayout& layout, const std::string& line) {
  const auto cells = splitCsvLine(line);
  if (cells.size() < layout.width) {
    throw ValidationError("Row has " + std::to_string(cells.size()) + " fields, header has " +
                          std::to_string(layout.width));
  }
  RawInput in;
  in.mlr           = parseNumber(cells[layout.column[0]], kVarMlr);
  in.crp           = parseNumber(cells[layout.column[1]], kVarCrp);
  in.triglycerides = parseNumber(cells[layout.column[2]], kVarTriglycerides);
  in.nlr           = parseNumber(cells[layout.column[3]], kVarNlr);
  in.ijvc          = parseCode(cells[layout.column[4]], kVarIjvc);
  in.sex           = parseCode(cells[layout.column[5]], kVarSex);
  return in;
}

} // namespace avf
