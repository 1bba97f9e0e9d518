#pragma once
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

namespace Log {
  // Opens <dir>/<file> for appending. Returns false (console only) when the
  // directory or file cannot be created.
  bool init(const std::string& dir = "./logs", const std::string& file = "avf_guardian.log");
  void shutdown();

  void setLevel(LogLevel lvl);
  // DEBUG, INFO, WARN/WARNING, ERROR in any case; anything else is Info.
  LogLevel parseLevel(const std::string& name);

  void write(LogLevel lvl, const char* fmt, ...);
}
