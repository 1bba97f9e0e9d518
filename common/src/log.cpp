#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

static std::mutex g_m;
static std::ofstream g_file;
static LogLevel g_level = LogLevel::Info;

bool Log::init(const std::string& dir, const std::string& file) {
  std::scoped_lock lk(g_m);
  if (g_file.is_open()) g_file.close();
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "[W] could not create log directory '" << dir << "': " << ec.message() << "\n";
    return false;
  }
  g_file.open(dir + "/" + file, std::ios::app);
  return g_file.is_open();
}

void Log::shutdown() {
  std::scoped_lock lk(g_m);
  if (g_file.is_open()) {
    g_file.flush();
    g_file.close();
  }
}

void Log::setLevel(LogLevel lvl) {
  std::scoped_lock lk(g_m);
  g_level = lvl;
}

LogLevel Log::parseLevel(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (s == "DEBUG") return LogLevel::Debug;
  if (s == "WARN" || s == "WARNING") return LogLevel::Warn;
  if (s == "ERROR") return LogLevel::Error;
  return LogLevel::Info;
}

void Log::write(LogLevel lvl, const char* fmt, ...) {
  std::scoped_lock lk(g_m);
  if (static_cast<int>(lvl) < static_cast<int>(g_level)) return;
  const char* tag = (lvl==LogLevel::Debug)?"D":(lvl==LogLevel::Info)?"I":(lvl==LogLevel::Warn)?"W":"E";
  char buf[1024];
  va_list ap; va_start(ap, fmt);
  vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  // errors go to stderr so batch stdout stays clean
  std::ostream& out = (lvl==LogLevel::Error) ? std::cerr : std::cout;
  out << "[" << tag << "] " << buf << "\n";
  if (g_file.is_open()) g_file << "[" << tag << "] " << buf << "\n";
}
