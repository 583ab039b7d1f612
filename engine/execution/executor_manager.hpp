#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "execution/executor_types.hpp"
#include "execution/panic_handler.hpp"
#include "execution/pool_config.hpp"
#include "execution/pool_wrapper.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

namespace taskexec {
namespace engine {
namespace execution {

using PoolMap = std::unordered_map<PoolName, std::shared_ptr<PoolWrapper>>;

struct ManagerOptions {
    // Optional observer for exceptions escaping tasks. Without one, panics
    // are written to std::cerr.
    std::shared_ptr<PanicHandler> panic_handler;

    // How long Reload/Shutdown wait for each retired pool to drain.
    std::chrono::milliseconds shutdown_timeout = ShutdownTimeout;
};

/**
 * @brief Executor manager interface
 *
 * Execute may be called from any number of threads at once. Reload and
 * Shutdown are serialized against each other and against the map lookup in
 * Execute only.
 */
class Manager {
public:
    virtual ~Manager() = default;

    /**
     * @brief Submit a task to the named pool
     *
     * Errors: POOL_NOT_FOUND, POOL_OVERLOAD (non-blocking pools only),
     * MANAGER_CLOSED, or a worker pool specific code.
     * Blocks while a blocking pool is full.
     */
    virtual Status Execute(const PoolName& pool_name, Task task) = 0;

    /**
     * @brief Replace every pool with ones built from `configs`
     *
     * All-or-nothing: on failure the current pools keep serving untouched.
     * Retired pools drain in the background of this call, each bounded by
     * the shutdown timeout.
     */
    virtual Status Reload(const std::vector<PoolConfig>& configs) = 0;

    /**
     * @brief Close the manager and drain every pool
     *
     * Terminal. Every later call returns MANAGER_CLOSED.
     */
    virtual void Shutdown() = 0;

    virtual Status GetPoolStats(const PoolName& pool_name, PoolStats& stats) const = 0;
    virtual std::vector<PoolName> ListPools() const = 0;
};

/**
 * @brief Create a manager owning one pool per config
 *
 * Fails with INVALID_CONFIG on an empty list, an empty name or a duplicate
 * name. Pools built before the failure are released.
 */
Status NewManager(const std::vector<PoolConfig>& configs,
                  std::shared_ptr<Manager>& manager,
                  const ManagerOptions& options = ManagerOptions());

/**
 * @brief Build a complete pool map from `configs`
 *
 * On the first duplicate name or construction failure every pool built so
 * far is released and `pools` is left untouched.
 */
Status BuildPools(const std::vector<PoolConfig>& configs,
                  const ManagerOptions& options,
                  PoolMap& pools);

// Releases all pools in parallel, each bounded by `timeout`. Timeouts are
// logged, not returned.
void ReleasePools(const PoolMap& pools, std::chrono::milliseconds timeout);

class ExecutorManager : public Manager {
public:
    ExecutorManager(PoolMap pools, const ManagerOptions& options);
    ~ExecutorManager() override;

    ExecutorManager(const ExecutorManager&) = delete;
    ExecutorManager& operator=(const ExecutorManager&) = delete;

    Status Execute(const PoolName& pool_name, Task task) override;
    Status Reload(const std::vector<PoolConfig>& configs) override;
    void Shutdown() override;

    Status GetPoolStats(const PoolName& pool_name, PoolStats& stats) const override;
    std::vector<PoolName> ListPools() const override;

    bool IsClosed() const { return closed_.load(std::memory_order_acquire); }

private:
    // Looks up `pool_name` in the active map under the shared lock.
    std::shared_ptr<PoolWrapper> FindPool(const PoolName& pool_name,
                                          std::shared_ptr<const PoolMap>& generation) const;

    // Protects the pools_ pointer; the map it points to is never modified.
    mutable std::shared_mutex pools_mutex_;
    std::shared_ptr<const PoolMap> pools_;

    std::atomic<bool> closed_{false};
    ManagerOptions options_;

    Logger logger_;
};

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
