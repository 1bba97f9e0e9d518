#include "batch_runner.hpp"
#include "log.hpp"
#include "errors.hpp"
#include "input_validation.hpp"
#include "patient_csv.hpp"
#include "pipeline.hpp"
#include "report_io.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace avf {

int runBatch(const CliConfig& CFG, const ArtifactStore& store) {
  std::ifstream f(CFG.batch_path);
  if (!f.is_open()) {
    Log::write(LogLevel::Error, "Could not open patient file: %s", CFG.batch_path.c_str());
    return 1;
  }

  std::error_code ec;
  const auto sz = std::filesystem::file_size(CFG.batch_path, ec);
  const std::uintmax_t MAX_BYTES = 10 * 1024 * 1024; // 10 MB
  if (!ec && sz > MAX_BYTES) {
    Log::write(LogLevel::Warn, "%s is large (%ju bytes), scoring may take a while",
               CFG.batch_path.c_str(), static_cast<std::uintmax_t>(sz));
  }

  std::string line;
  if (!std::getline(f, line)) {
    Log::write(LogLevel::Error, "Empty patient file: %s", CFG.batch_path.c_str());
    return 1;
  }
  PatientCsvLayout layout;
  try {
    layout = parsePatientHeader(line);
  } catch (const ValidationError& e) {
    Log::write(LogLevel::Error, "%s: %s", CFG.batch_path.c_str(), e.what());
    return 1;
  }

  const auto parent = std::filesystem::path(CFG.out_path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent, ec);
  std::ofstream out(CFG.out_path, std::ios::trunc);
  if (!out.is_open()) {
    Log::write(LogLevel::Error, "Could not open %s for writing", CFG.out_path.c_str());
    return 1;
  }
  out << reportHeader();

  std::size_t row = 0, failed = 0;
  std::map<std::string, int> bands;
  while (std::getline(f, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    ReportRow rep;
    rep.row = ++row;
    try {
      const RawInput in = parsePatientRow(layout, line);
      validateRawInput(in);
      const PredictionResult r = predict(in, store);
      rep.probability = r.probability;
      rep.risk_band = riskBand(r.probability);
      if (!r.contributions.empty()) {
        rep.top_factor = r.contributions.front().label;
        rep.top_contribution = r.contributions.front().value;
      }
      ++bands[rep.risk_band];
    } catch (const Error& e) {
      rep.status = "error:" + errorKind(e);
      ++failed;
      Log::write(LogLevel::Warn, "Row %zu not scored (%s): %s", rep.row, errorKind(e).c_str(), e.what());
    }
    out << reportToCsv(rep);
  }

  Log::write(LogLevel::Info, "Scored %zu of %zu rows | low=%d moderate=%d high=%d",
             row - failed, row, bands["low"], bands["moderate"], bands["high"]);
  Log::write(LogLevel::Info, "Wrote %zu report rows to %s", row, CFG.out_path.c_str());
  return failed ? 2 : 0;
}

} // namespace avf
