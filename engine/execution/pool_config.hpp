#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "execution/executor_types.hpp"
#include "utils/status.hpp"

namespace taskexec {
namespace engine {
namespace execution {

/**
 * @brief Configuration of a single named pool
 *
 * Validate() repairs out-of-range values instead of rejecting them:
 * - size is clamped into [MinPoolSize, MaxPoolSize]
 * - a non-positive expiry becomes DefaultWorkerExpiry
 * Only an empty name fails validation. Every repair is logged as a warning.
 */
struct PoolConfig {
    PoolName name;
    int size = DefaultPoolSize;
    std::chrono::milliseconds expiry = DefaultWorkerExpiry;
    bool non_blocking = DefaultNonBlocking;

    PoolConfig() = default;
    PoolConfig(PoolName pool_name, int pool_size,
               std::chrono::milliseconds worker_expiry = DefaultWorkerExpiry,
               bool nonblocking = DefaultNonBlocking)
        : name(std::move(pool_name)),
          size(pool_size),
          expiry(worker_expiry),
          non_blocking(nonblocking) {}

    Status Validate();

    std::string ToString() const;

    bool operator==(const PoolConfig& other) const {
        return name == other.name && size == other.size &&
               expiry == other.expiry && non_blocking == other.non_blocking;
    }

    bool operator!=(const PoolConfig& other) const {
        return !(*this == other);
    }
};

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
