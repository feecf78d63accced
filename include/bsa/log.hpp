#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace bsa {

enum class LogLevel {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

// Process-wide logger. Warn and Error go to stderr, the rest to stdout.
class Logger {
public:
  static Logger &get();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void setLevel(LogLevel level);
  LogLevel level() const;

  // Additionally append every line to a file
  bool setLogFile(const std::filesystem::path &path);

  void log(LogLevel level, const std::string &msg);

  void debug(const std::string &msg) { log(LogLevel::Debug, msg); }
  void info(const std::string &msg) { log(LogLevel::Info, msg); }
  void warn(const std::string &msg) { log(LogLevel::Warn, msg); }
  void error(const std::string &msg) { log(LogLevel::Error, msg); }

private:
  Logger() = default;

  static std::string formatLine(LogLevel level, const std::string &msg);

  mutable std::mutex mutex_;
  LogLevel level_ = LogLevel::Warn;
  std::ofstream file_;
};

} // namespace bsa

#define BSA_LOG_DEBUG(msg) ::bsa::Logger::get().debug(msg)
#define BSA_LOG_INFO(msg) ::bsa::Logger::get().info(msg)
#define BSA_LOG_WARN(msg) ::bsa::Logger::get().warn(msg)
#define BSA_LOG_ERROR(msg) ::bsa::Logger::get().error(msg)
