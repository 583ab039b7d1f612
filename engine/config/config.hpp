#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace taskexec {
namespace config {

// ============================================================================
// Environment overrides and their limits
// ============================================================================

struct ConfigLimits {
  // Per-pool release wait used by Reload/Shutdown
  static constexpr int SHUTDOWN_TIMEOUT_MS_DEFAULT = 5000;
  static constexpr int SHUTDOWN_TIMEOUT_MS_MIN = 1;
  static constexpr int SHUTDOWN_TIMEOUT_MS_MAX = 600000;

  static constexpr const char* ENV_EXECUTOR_ENABLED = "TASKEXEC_EXECUTOR_ENABLED";
  static constexpr const char* ENV_SHUTDOWN_TIMEOUT_MS = "TASKEXEC_SHUTDOWN_TIMEOUT_MS";

  // Helper function to get limit from environment or use default
  static int GetEnvInt(const char* env_name, int default_value, int min_value, int max_value) {
    const char* env_value = std::getenv(env_name);
    if (env_value != nullptr) {
      char* end;
      errno = 0;
      long value_long = std::strtol(env_value, &end, 10);

      if (errno == ERANGE || value_long > INT_MAX || value_long < INT_MIN) {
        printf("[ConfigLimits] Warning: %s=%s out of range (overflow), using default %d\n",
               env_name, env_value, default_value);
        return default_value;
      }

      if (end == env_value || *end != '\0') {
        printf("[ConfigLimits] Warning: %s=%s invalid integer, using default %d\n",
               env_name, env_value, default_value);
        return default_value;
      }

      int value = static_cast<int>(value_long);
      if (value >= min_value && value <= max_value) {
        return value;
      }
      printf("[ConfigLimits] Warning: %s=%s out of range [%d, %d], using default %d\n",
             env_name, env_value, min_value, max_value, default_value);
    }
    return default_value;
  }

  // Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
  static bool GetEnvBool(const char* env_name, bool default_value) {
    const char* env_value = std::getenv(env_name);
    if (env_value == nullptr) {
      return default_value;
    }
    std::string value(env_value);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
      return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
      return false;
    }
    printf("[ConfigLimits] Warning: %s=%s invalid boolean, using default %s\n",
           env_name, env_value, default_value ? "true" : "false");
    return default_value;
  }
};

}  // namespace config
}  // namespace taskexec
