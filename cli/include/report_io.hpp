#pragma once
#include <cstddef>
#include <string>

namespace avf {

struct ReportRow {
  std::size_t row{};            // 1-based data row in the input CSV
  double probability{};         // meaningless unless status == "ok"
  std::string risk_band;
  std::string top_factor;       // display label of the largest |contribution|
  double top_contribution{};
  std::string status = "ok";    // "ok" or "error:<kind>"
};

// Display bands used by the entry form: < 0.2 low, < 0.5 moderate, else high.
inline const char* riskBand(double p) {
  if (p < 0.2) return "low";
  if (p < 0.5) return "moderate";
  return "high";
}

inline std::string csvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string q = "\"";
  for (char c : s) { if (c == '"') q += '"'; q += c; }
  return q + "\"";
}

inline std::string reportHeader() {
  return "row,probability,risk_band,top_factor,top_contribution,status\n";
}

inline std::string reportToCsv(const ReportRow& r) {
  // failed rows keep their position but leave the numeric columns blank
  if (r.status != "ok") {
    return std::to_string(r.row) + ",,,,," + csvField(r.status) + "\n";
  }
  return std::to_string(r.row) + "," +
         std::to_string(r.probability) + "," +
         r.risk_band + "," +
         csvField(r.top_factor) + "," +
         std::to_string(r.top_contribution) + "," +
         r.status + "\n";
}

} // namespace avf
