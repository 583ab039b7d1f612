#include "config/executor_config.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <unordered_set>

#include <nlohmann/json.hpp>

#include "config/config.hpp"

namespace taskexec {
namespace config {

using engine::execution::MaxPoolSize;
using engine::execution::MinPoolSize;
using engine::execution::PoolConfig;

namespace {

Status InvalidExecutorConfig(const std::string& reason) {
  return Status(INVALID_CONFIG, std::string(kErrMsgInvalidConfig) + reason);
}

// Reads an optional integer field, rejecting values outside [min_value, max_value]
// instead of letting the conversion wrap them.
Status ReadIntegerField(const nlohmann::json& object, const std::string& key,
                        int64_t min_value, int64_t max_value, int64_t& value) {
  if (!object.contains(key)) {
    return Status::OK();
  }
  const nlohmann::json& field = object.at(key);
  if (!field.is_number_integer()) {
    return Status(CONFIG_LOAD_ERROR, "\"" + key + "\" must be an integer");
  }
  bool in_range;
  if (field.is_number_unsigned()) {
    in_range = field.get<uint64_t>() <= static_cast<uint64_t>(max_value) &&
               (min_value <= 0 || field.get<uint64_t>() >= static_cast<uint64_t>(min_value));
  } else {
    int64_t signed_value = field.get<int64_t>();
    in_range = signed_value >= min_value && signed_value <= max_value;
  }
  if (!in_range) {
    return Status(CONFIG_LOAD_ERROR, "\"" + key + "\" is out of range: " + field.dump());
  }
  value = field.get<int64_t>();
  return Status::OK();
}

Status ParsePool(const nlohmann::json& entry, size_t index, ExecutorPoolConfig& pool) {
  if (!entry.is_object()) {
    return Status(CONFIG_LOAD_ERROR, "pools[" + std::to_string(index) + "] is not an object");
  }
  constexpr int64_t kIntMin = std::numeric_limits<int>::min();
  constexpr int64_t kIntMax = std::numeric_limits<int>::max();

  int64_t size = engine::execution::DefaultPoolSize;
  int64_t expiry = pool.expiry_seconds;
  Status status = ReadIntegerField(entry, "size", kIntMin, kIntMax, size);
  if (status.ok()) {
    status = ReadIntegerField(entry, "expiry", kIntMin, kIntMax, expiry);
  }
  if (!status.ok()) {
    return Status(status.code(), "pools[" + std::to_string(index) + "]: " + status.message());
  }

  pool.name = entry.value("name", std::string());
  pool.size = static_cast<int>(size);
  pool.expiry_seconds = static_cast<int>(expiry);
  pool.non_blocking = entry.value("non_blocking", engine::execution::DefaultNonBlocking);
  return Status::OK();
}

}  // namespace

Status ExecutorConfig::Validate() const {
  if (shutdown_timeout.count() < ConfigLimits::SHUTDOWN_TIMEOUT_MS_MIN ||
      shutdown_timeout.count() > ConfigLimits::SHUTDOWN_TIMEOUT_MS_MAX) {
    return InvalidExecutorConfig("shutdown timeout " + std::to_string(shutdown_timeout.count()) +
                                 "ms must be between " +
                                 std::to_string(ConfigLimits::SHUTDOWN_TIMEOUT_MS_MIN) + " and " +
                                 std::to_string(ConfigLimits::SHUTDOWN_TIMEOUT_MS_MAX) + "ms");
  }
  if (!enabled) {
    return Status::OK();
  }
  if (pools.empty()) {
    return InvalidExecutorConfig("executor enabled but no pools configured");
  }

  std::unordered_set<std::string> names;
  for (size_t i = 0; i < pools.size(); ++i) {
    const auto& pool = pools[i];
    if (pool.name.empty()) {
      return InvalidExecutorConfig("pool " + std::to_string(i) + ": name is required");
    }
    if (!names.insert(pool.name).second) {
      return InvalidExecutorConfig("duplicate pool name: " + pool.name);
    }
    if (pool.size < MinPoolSize || pool.size > MaxPoolSize) {
      return InvalidExecutorConfig("pool " + pool.name + ": size must be between " +
                                   std::to_string(MinPoolSize) + " and " +
                                   std::to_string(MaxPoolSize));
    }
    if (pool.expiry_seconds < 0) {
      return InvalidExecutorConfig("pool " + pool.name + ": expiry must be non-negative");
    }
  }
  return Status::OK();
}

std::vector<PoolConfig> ExecutorConfig::ToPoolConfigs() const {
  std::vector<PoolConfig> configs;
  configs.reserve(pools.size());
  for (const auto& pool : pools) {
    configs.emplace_back(pool.name, pool.size,
                         std::chrono::seconds(pool.expiry_seconds),
                         pool.non_blocking);
  }
  return configs;
}

void ExecutorConfig::ApplyEnvOverrides() {
  enabled = ConfigLimits::GetEnvBool(ConfigLimits::ENV_EXECUTOR_ENABLED, enabled);

  int64_t configured_ms = shutdown_timeout.count();
  int timeout_ms = ConfigLimits::SHUTDOWN_TIMEOUT_MS_DEFAULT;
  if (configured_ms >= ConfigLimits::SHUTDOWN_TIMEOUT_MS_MIN &&
      configured_ms <= ConfigLimits::SHUTDOWN_TIMEOUT_MS_MAX) {
    timeout_ms = static_cast<int>(configured_ms);
  } else {
    engine::Logger logger;
    logger.Warning("Shutdown timeout " + std::to_string(configured_ms) + "ms out of range [" +
                   std::to_string(ConfigLimits::SHUTDOWN_TIMEOUT_MS_MIN) + ", " +
                   std::to_string(ConfigLimits::SHUTDOWN_TIMEOUT_MS_MAX) + "], using default " +
                   std::to_string(timeout_ms) + "ms");
  }
  shutdown_timeout = std::chrono::milliseconds(
      ConfigLimits::GetEnvInt(ConfigLimits::ENV_SHUTDOWN_TIMEOUT_MS, timeout_ms,
                              ConfigLimits::SHUTDOWN_TIMEOUT_MS_MIN,
                              ConfigLimits::SHUTDOWN_TIMEOUT_MS_MAX));
}

ExecutorConfig DefaultExecutorConfig() {
  ExecutorConfig config;
  config.enabled = true;
  config.pools = {
      {"http", 200, 10, true},
      {"database", 50, 10, false},
      {"background", 30, 10, true},
  };
  return config;
}

Status LoadExecutorConfigFromString(const std::string& content, ExecutorConfig& config) {
  ExecutorConfig loaded;
  try {
    nlohmann::json doc = nlohmann::json::parse(content);
    if (!doc.is_object()) {
      return Status(CONFIG_LOAD_ERROR, "executor config must be a JSON object");
    }

    const nlohmann::json& section = doc.contains("executor") ? doc.at("executor") : doc;
    if (!section.is_object()) {
      return Status(CONFIG_LOAD_ERROR, "\"executor\" must be a JSON object");
    }

    loaded.enabled = section.value("enabled", true);
    int64_t timeout_ms = loaded.shutdown_timeout.count();
    Status status = ReadIntegerField(section, "shutdown_timeout_ms",
                                     std::numeric_limits<int64_t>::min(),
                                     std::numeric_limits<int64_t>::max(), timeout_ms);
    if (!status.ok()) {
      return status;
    }
    loaded.shutdown_timeout = std::chrono::milliseconds(timeout_ms);

    if (section.contains("pools")) {
      const nlohmann::json& pools = section.at("pools");
      if (!pools.is_array()) {
        return Status(CONFIG_LOAD_ERROR, "\"pools\" must be a JSON array");
      }
      for (size_t i = 0; i < pools.size(); ++i) {
        ExecutorPoolConfig pool;
        Status status = ParsePool(pools[i], i, pool);
        if (!status.ok()) {
          return status;
        }
        loaded.pools.push_back(pool);
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return Status(CONFIG_LOAD_ERROR, "failed to parse executor config: " + std::string(e.what()));
  }

  config = std::move(loaded);
  return Status::OK();
}

Status LoadExecutorConfigFromFile(const std::string& file_path, ExecutorConfig& config) {
  std::ifstream file(file_path);
  if (!file.is_open()) {
    return Status(CONFIG_LOAD_ERROR, "cannot open config file: " + file_path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  Status status = LoadExecutorConfigFromString(content, config);
  if (!status.ok()) {
    return Status(status.code(), file_path + ": " + status.message());
  }

  engine::Logger logger;
  logger.Info("Loaded executor configuration from " + file_path);
  return Status::OK();
}

}  // namespace config
}  // namespace taskexec
