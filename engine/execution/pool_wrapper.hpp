#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "execution/executor_types.hpp"
#include "execution/panic_handler.hpp"
#include "execution/pool_config.hpp"
#include "execution/worker_pool.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

namespace taskexec {
namespace engine {
namespace execution {

/**
 * @brief Statistics snapshot for one pool
 */
struct PoolStats {
    PoolName name;
    size_t capacity = 0;
    size_t running = 0;
    size_t free = 0;
    size_t waiting = 0;
    bool non_blocking = false;
    std::chrono::milliseconds expiry{0};

    uint64_t tasks_submitted = 0;
    uint64_t tasks_completed = 0;
    uint64_t tasks_panicked = 0;
    uint64_t tasks_rejected = 0;
};

/**
 * @brief Owns one WorkerPool and makes it panic-safe and release-safe
 *
 * Every submitted task runs inside a try/catch. An escaping exception goes to
 * the injected PanicHandler, or to a single line on std::cerr when there is
 * none. The submitter never learns about it.
 */
class PoolWrapper {
public:
    static Status Create(PoolConfig config,
                         std::shared_ptr<PanicHandler> panic_handler,
                         std::shared_ptr<PoolWrapper>& wrapper);

    PoolWrapper(const PoolWrapper&) = delete;
    PoolWrapper& operator=(const PoolWrapper&) = delete;

    /**
     * @brief Submit a task wrapped with panic recovery
     *
     * WORKER_POOL_OVERLOAD is reported as POOL_OVERLOAD and
     * WORKER_POOL_CLOSED as MANAGER_CLOSED. Anything else passes through.
     */
    Status Submit(Task task);

    /**
     * @brief Release the pool, waiting at most `timeout`
     *
     * The drain runs on a background thread. On SHUTDOWN_TIMEOUT it keeps
     * going and frees the pool once the remaining tasks finish; only the
     * caller's wait is bounded.
     */
    Status ReleaseTimeout(std::chrono::milliseconds timeout);

    size_t Running() const;
    size_t Free() const;
    size_t Cap() const;

    PoolStats GetStats() const;

    const PoolName& GetName() const { return config_.name; }
    const PoolConfig& GetConfig() const { return config_; }

private:
    struct Counters {
        std::atomic<uint64_t> submitted{0};
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> panicked{0};
        std::atomic<uint64_t> rejected{0};
    };

    PoolWrapper(PoolConfig config,
                std::shared_ptr<WorkerPool> pool,
                std::shared_ptr<PanicHandler> panic_handler);

    Task WrapTaskWithRecover(Task task) const;

    PoolConfig config_;
    std::shared_ptr<WorkerPool> pool_;
    std::shared_ptr<PanicHandler> panic_handler_;
    // Shared with in-flight tasks, which may outlive the wrapper while a
    // timed-out release is still draining.
    std::shared_ptr<Counters> counters_;

    Logger logger_;
};

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
