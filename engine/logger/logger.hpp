#pragma once

#include <string>

namespace taskexec {
namespace engine {

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3
};

class Logger {
 public:
  void Info(const std::string& message);
  void Warning(const std::string& message);
  void Error(const std::string& message);
  void Debug(const std::string& message);

  // Overrides the TASKEXEC_LOG_LEVEL threshold for the whole process.
  static void SetLevel(LogLevel level);
  static LogLevel GetLevel();
};

}  // namespace engine
}  // namespace taskexec
