#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace taskexec {
namespace engine {
namespace execution {

/**
 * @brief Routing key of a pool, unique within one manager
 */
using PoolName = std::string;

/**
 * @brief Unit of work accepted by the executor
 */
using Task = std::function<void()>;

// Pool sizing limits. Validation clamps into [MinPoolSize, MaxPoolSize].
constexpr int MinPoolSize = 1;
constexpr int MaxPoolSize = 10000;
constexpr int DefaultPoolSize = 100;

// Idle workers are reclaimed after this long without work.
constexpr std::chrono::milliseconds DefaultWorkerExpiry{10000};

// Pools reject instead of block when full unless configured otherwise.
constexpr bool DefaultNonBlocking = true;

// Upper bound on how long Reload/Shutdown wait for one pool to drain.
constexpr std::chrono::milliseconds ShutdownTimeout{5000};

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
