#include <chrono>
#include <ctime>
#include <format>
#include <iostream>

#include <bsa/log.hpp>

namespace bsa {

namespace {

const char *levelName(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO ";
  case LogLevel::Warn:
    return "WARN ";
  case LogLevel::Error:
    return "ERROR";
  }
  return "?????";
}

} // namespace

Logger &Logger::get() {
  static Logger instance;
  return instance;
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::setLogFile(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  file_.close();
  file_.open(path, std::ios::app);
  return file_.is_open();
}

void Logger::log(LogLevel level, const std::string &msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < level_) {
    return;
  }

  std::string line = formatLine(level, msg);
  if (level >= LogLevel::Warn) {
    std::cerr << line << "\n";
  } else {
    std::cout << line << "\n";
  }

  if (file_.is_open()) {
    file_ << line << "\n";
    file_.flush();
  }
}

std::string Logger::formatLine(LogLevel level, const std::string &msg) {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &t);
#else
  localtime_r(&t, &local);
#endif

  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
  return std::format("{}.{:03} [{}] {}", stamp, ms, levelName(level), msg);
}

} // namespace bsa
