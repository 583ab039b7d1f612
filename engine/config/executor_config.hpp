#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "execution/pool_config.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

namespace taskexec {
namespace config {

/**
 * @brief One pool entry as written in the configuration file
 *
 * Expiry is in whole seconds here; ToPoolConfigs() converts it.
 */
struct ExecutorPoolConfig {
  std::string name;
  int size = engine::execution::DefaultPoolSize;
  int expiry_seconds = 10;
  bool non_blocking = engine::execution::DefaultNonBlocking;

  bool operator==(const ExecutorPoolConfig& other) const {
    return name == other.name && size == other.size &&
           expiry_seconds == other.expiry_seconds && non_blocking == other.non_blocking;
  }
  bool operator!=(const ExecutorPoolConfig& other) const { return !(*this == other); }
};

/**
 * @brief Application level executor configuration
 *
 * JSON layout, the outer "executor" object is optional:
 *   {"executor": {"enabled": true,
 *                 "pools": [{"name": "http", "size": 200, "expiry": 10, "non_blocking": true}]}}
 */
struct ExecutorConfig {
  bool enabled = true;
  std::vector<ExecutorPoolConfig> pools;
  std::chrono::milliseconds shutdown_timeout{engine::execution::ShutdownTimeout};

  /**
   * @brief Strict validation, unlike PoolConfig::Validate which repairs
   *
   * The shutdown timeout must lie within the ConfigLimits bounds. Beyond
   * that a disabled config is always valid. Otherwise there must be at least one
   * pool, names must be non-empty and unique, sizes within
   * [MinPoolSize, MaxPoolSize] and expiries non-negative.
   */
  Status Validate() const;

  // Converts to manager configs, preserving order.
  std::vector<engine::execution::PoolConfig> ToPoolConfigs() const;

  // True when applying `other` needs a pool rebuild. The shutdown timeout and
  // the enabled flag are not part of it.
  bool PoolsChanged(const ExecutorConfig& other) const { return pools != other.pools; }

  // Applies TASKEXEC_EXECUTOR_ENABLED and TASKEXEC_SHUTDOWN_TIMEOUT_MS.
  void ApplyEnvOverrides();

  bool operator==(const ExecutorConfig& other) const {
    return enabled == other.enabled && pools == other.pools &&
           shutdown_timeout == other.shutdown_timeout;
  }
  bool operator!=(const ExecutorConfig& other) const { return !(*this == other); }
};

ExecutorConfig DefaultExecutorConfig();

Status LoadExecutorConfigFromString(const std::string& content, ExecutorConfig& config);
Status LoadExecutorConfigFromFile(const std::string& file_path, ExecutorConfig& config);

}  // namespace config
}  // namespace taskexec
