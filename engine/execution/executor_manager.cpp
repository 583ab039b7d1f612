#include "execution/executor_manager.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace taskexec {
namespace engine {
namespace execution {

Status NewManager(const std::vector<PoolConfig>& configs,
                  std::shared_ptr<Manager>& manager,
                  const ManagerOptions& options) {
    if (configs.empty()) {
        return Status(INVALID_CONFIG, std::string(kErrMsgInvalidConfig) + "no configs provided");
    }

    PoolMap pools;
    Status status = BuildPools(configs, options, pools);
    if (!status.ok()) {
        return status;
    }

    manager = std::make_shared<ExecutorManager>(std::move(pools), options);
    return Status::OK();
}

Status BuildPools(const std::vector<PoolConfig>& configs,
                  const ManagerOptions& options,
                  PoolMap& pools) {
    PoolMap built;
    built.reserve(configs.size());

    for (const auto& config : configs) {
        if (built.find(config.name) != built.end()) {
            ReleasePools(built, options.shutdown_timeout);
            return Status(INVALID_CONFIG,
                          std::string(kErrMsgInvalidConfig) + "duplicate pool name: " + config.name);
        }

        std::shared_ptr<PoolWrapper> pool;
        Status status = PoolWrapper::Create(config, options.panic_handler, pool);
        if (!status.ok()) {
            ReleasePools(built, options.shutdown_timeout);
            return status;
        }

        built.emplace(config.name, std::move(pool));
    }

    pools.swap(built);
    return Status::OK();
}

void ReleasePools(const PoolMap& pools, std::chrono::milliseconds timeout) {
    if (pools.empty()) {
        return;
    }

    Logger logger;
    auto release_one = [timeout, &logger](const std::shared_ptr<PoolWrapper>& pool) {
        Status status = pool->ReleaseTimeout(timeout);
        if (!status.ok()) {
            logger.Warning("Pool '" + pool->GetName() + "' did not drain in time, " +
                           "it keeps draining in the background: " + status.message());
        }
    };

    std::vector<std::thread> releasers;
    releasers.reserve(pools.size());
    for (const auto& entry : pools) {
        try {
            releasers.emplace_back(release_one, entry.second);
        } catch (const std::system_error& e) {
            logger.Warning("Releasing pool '" + entry.first + "' inline: " + e.what());
            release_one(entry.second);
        }
    }

    for (auto& releaser : releasers) {
        releaser.join();
    }
}

ExecutorManager::ExecutorManager(PoolMap pools, const ManagerOptions& options)
    : pools_(std::make_shared<const PoolMap>(std::move(pools))),
      options_(options) {
    logger_.Info("Executor manager initialized with " + std::to_string(pools_->size()) + " pools");
}

ExecutorManager::~ExecutorManager() {
    Shutdown();
}

std::shared_ptr<PoolWrapper> ExecutorManager::FindPool(
    const PoolName& pool_name,
    std::shared_ptr<const PoolMap>& generation) const {
    std::shared_lock<std::shared_mutex> lock(pools_mutex_);
    generation = pools_;
    auto it = pools_->find(pool_name);
    if (it == pools_->end()) {
        return nullptr;
    }
    return it->second;
}

Status ExecutorManager::Execute(const PoolName& pool_name, Task task) {
    if (closed_.load(std::memory_order_acquire)) {
        return Status(MANAGER_CLOSED, kErrMsgManagerClosed);
    }

    std::shared_ptr<const PoolMap> generation;
    std::shared_ptr<PoolWrapper> pool = FindPool(pool_name, generation);
    if (!pool) {
        return Status(POOL_NOT_FOUND, kErrMsgPoolNotFound + pool_name);
    }

    Status status = pool->Submit(task);

    // The pool may have been retired by a Reload between lookup and submit.
    // While the manager itself is open, route once more against the new map.
    if (status.code() == MANAGER_CLOSED && !closed_.load(std::memory_order_acquire)) {
        std::shared_ptr<const PoolMap> current;
        std::shared_ptr<PoolWrapper> replacement = FindPool(pool_name, current);
        if (current != generation) {
            if (!replacement) {
                return Status(POOL_NOT_FOUND, kErrMsgPoolNotFound + pool_name);
            }
            status = replacement->Submit(std::move(task));
        }
    }

    if (status.code() == POOL_OVERLOAD) {
        return Status(POOL_OVERLOAD, std::string(kErrMsgPoolOverload) + ": " + pool_name);
    }
    return status;
}

Status ExecutorManager::Reload(const std::vector<PoolConfig>& configs) {
    if (closed_.load(std::memory_order_acquire)) {
        return Status(MANAGER_CLOSED, kErrMsgManagerClosed);
    }

    PoolMap new_pools;
    Status status = BuildPools(configs, options_, new_pools);
    if (!status.ok()) {
        logger_.Error("Executor reload rejected, keeping current pools: " + status.message());
        return Status(status.code(), kErrMsgReloadFailed + status.message());
    }

    auto replacement = std::make_shared<const PoolMap>(std::move(new_pools));
    std::shared_ptr<const PoolMap> old_pools;
    {
        std::unique_lock<std::shared_mutex> lock(pools_mutex_);
        // Shutdown may have won the race since the check above.
        if (closed_.load(std::memory_order_acquire)) {
            lock.unlock();
            ReleasePools(*replacement, options_.shutdown_timeout);
            return Status(MANAGER_CLOSED, kErrMsgManagerClosed);
        }
        old_pools = pools_;
        pools_ = replacement;
    }

    logger_.Info("Executor reloaded with " + std::to_string(replacement->size()) +
                 " pools, draining " + std::to_string(old_pools->size()) + " retired pools");
    ReleasePools(*old_pools, options_.shutdown_timeout);
    return Status::OK();
}

void ExecutorManager::Shutdown() {
    closed_.store(true, std::memory_order_release);

    auto empty = std::make_shared<const PoolMap>();
    std::shared_ptr<const PoolMap> old_pools;
    {
        std::unique_lock<std::shared_mutex> lock(pools_mutex_);
        old_pools = pools_;
        pools_ = empty;
    }

    if (old_pools->empty()) {
        return;
    }

    logger_.Info("Shutting down executor, draining " + std::to_string(old_pools->size()) + " pools");
    ReleasePools(*old_pools, options_.shutdown_timeout);
    logger_.Info("Executor shutdown complete");
}

Status ExecutorManager::GetPoolStats(const PoolName& pool_name, PoolStats& stats) const {
    if (closed_.load(std::memory_order_acquire)) {
        return Status(MANAGER_CLOSED, kErrMsgManagerClosed);
    }

    std::shared_ptr<const PoolMap> generation;
    std::shared_ptr<PoolWrapper> pool = FindPool(pool_name, generation);
    if (!pool) {
        return Status(POOL_NOT_FOUND, kErrMsgPoolNotFound + pool_name);
    }
    stats = pool->GetStats();
    return Status::OK();
}

std::vector<PoolName> ExecutorManager::ListPools() const {
    std::vector<PoolName> names;
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        names.reserve(pools_->size());
        for (const auto& entry : *pools_) {
            names.push_back(entry.first);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
