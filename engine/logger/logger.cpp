#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>

namespace taskexec {
namespace engine {

namespace {

std::mutex g_log_mutex;

LogLevel ParseEnvLevel() {
  const char* env_level = std::getenv("TASKEXEC_LOG_LEVEL");
  if (env_level == nullptr) {
    return LogLevel::INFO;
  }
  std::string value(env_level);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (value == "debug") return LogLevel::DEBUG;
  if (value == "warning" || value == "warn") return LogLevel::WARNING;
  if (value == "error") return LogLevel::ERROR;
  return LogLevel::INFO;
}

std::atomic<int>& LevelSlot() {
  static std::atomic<int> level{static_cast<int>(ParseEnvLevel())};
  return level;
}

void Log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) < LevelSlot().load(std::memory_order_relaxed)) {
    return;
  }

  std::time_t now = std::time(nullptr);
  std::tm local_tm{};
  localtime_r(&now, &local_tm);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local_tm);

  std::lock_guard<std::mutex> lock(g_log_mutex);
  switch (level) {
    case LogLevel::DEBUG:
      std::cout << "[" << timestamp << "] [DEBUG] " << message << std::endl;
      break;
    case LogLevel::INFO:
      std::cout << "[" << timestamp << "] [INFO] " << message << std::endl;
      break;
    case LogLevel::WARNING:
      std::cerr << "[" << timestamp << "] [WARNING] " << message << std::endl;
      break;
    case LogLevel::ERROR:
      std::cerr << "[" << timestamp << "] [ERROR] " << message << std::endl;
      break;
    default:
      break;
  }
}

}  // namespace

void Logger::SetLevel(LogLevel level) {
  LevelSlot().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::GetLevel() {
  return static_cast<LogLevel>(LevelSlot().load(std::memory_order_relaxed));
}

void Logger::Error(const std::string& message) {
  Log(LogLevel::ERROR, message);
}

void Logger::Info(const std::string& message) {
  Log(LogLevel::INFO, message);
}

void Logger::Warning(const std::string& message) {
  Log(LogLevel::WARNING, message);
}

void Logger::Debug(const std::string& message) {
  Log(LogLevel::DEBUG, message);
}

}  // namespace engine
}  // namespace taskexec
