#include "execution/pool_wrapper.hpp"

#include <future>
#include <iostream>
#include <system_error>
#include <thread>
#include <utility>

namespace taskexec {
namespace engine {
namespace execution {

Status PoolWrapper::Create(PoolConfig config,
                           std::shared_ptr<PanicHandler> panic_handler,
                           std::shared_ptr<PoolWrapper>& wrapper) {
    Status status = config.Validate();
    if (!status.ok()) {
        return status;
    }

    std::shared_ptr<WorkerPool> pool;
    status = WorkerPool::Create(config.name,
                                static_cast<size_t>(config.size),
                                config.expiry,
                                config.non_blocking,
                                pool);
    if (!status.ok()) {
        return Status(status.code(), "failed to create pool " + config.name + ": " + status.message());
    }

    wrapper.reset(new PoolWrapper(std::move(config), std::move(pool), std::move(panic_handler)));
    return Status::OK();
}

PoolWrapper::PoolWrapper(PoolConfig config,
                         std::shared_ptr<WorkerPool> pool,
                         std::shared_ptr<PanicHandler> panic_handler)
    : config_(std::move(config)),
      pool_(std::move(pool)),
      panic_handler_(std::move(panic_handler)),
      counters_(std::make_shared<Counters>()) {
}

Status PoolWrapper::Submit(Task task) {
    if (!pool_) {
        return Status(MANAGER_CLOSED, kErrMsgManagerClosed);
    }
    if (!task) {
        return Status(WORKER_POOL_INVALID_ARGUMENT, "cannot submit an empty task");
    }

    Status status = pool_->Submit(WrapTaskWithRecover(std::move(task)));
    if (status.ok()) {
        counters_->submitted.fetch_add(1, std::memory_order_relaxed);
        return status;
    }

    switch (status.code()) {
        case WORKER_POOL_OVERLOAD:
            counters_->rejected.fetch_add(1, std::memory_order_relaxed);
            return Status(POOL_OVERLOAD, kErrMsgPoolOverload);
        case WORKER_POOL_CLOSED:
            return Status(MANAGER_CLOSED, kErrMsgManagerClosed);
        default:
            return status;
    }
}

Status PoolWrapper::ReleaseTimeout(std::chrono::milliseconds timeout) {
    if (!pool_) {
        return Status::OK();
    }

    auto done = std::make_shared<std::promise<void>>();
    std::future<void> released = done->get_future();
    std::shared_ptr<WorkerPool> pool = pool_;

    try {
        std::thread([pool, done]() {
            pool->Release();
            done->set_value();
        }).detach();
    } catch (const std::system_error& e) {
        logger_.Warning("Cannot start background release for pool '" + config_.name +
                        "' (" + e.what() + "), releasing inline");
        pool->Release();
        return Status::OK();
    }

    if (released.wait_for(timeout) == std::future_status::ready) {
        return Status::OK();
    }
    return Status(SHUTDOWN_TIMEOUT,
                  std::string(kErrMsgShutdownTimeout) + " (pool " + config_.name + ")");
}

size_t PoolWrapper::Running() const {
    if (!pool_) {
        return 0;
    }
    return pool_->Running();
}

size_t PoolWrapper::Free() const {
    if (!pool_) {
        return 0;
    }
    return pool_->Free();
}

size_t PoolWrapper::Cap() const {
    if (!pool_) {
        return 0;
    }
    return pool_->Cap();
}

PoolStats PoolWrapper::GetStats() const {
    PoolStats stats;
    stats.name = config_.name;
    stats.non_blocking = config_.non_blocking;
    stats.expiry = config_.expiry;
    if (pool_) {
        stats.capacity = pool_->Cap();
        stats.running = pool_->Running();
        stats.free = pool_->Free();
        stats.waiting = pool_->Waiting();
    }
    stats.tasks_submitted = counters_->submitted.load(std::memory_order_relaxed);
    stats.tasks_completed = counters_->completed.load(std::memory_order_relaxed);
    stats.tasks_panicked = counters_->panicked.load(std::memory_order_relaxed);
    stats.tasks_rejected = counters_->rejected.load(std::memory_order_relaxed);
    return stats;
}

Task PoolWrapper::WrapTaskWithRecover(Task task) const {
    PoolName pool_name = config_.name;
    std::shared_ptr<PanicHandler> handler = panic_handler_;
    std::shared_ptr<Counters> counters = counters_;

    return [pool_name, handler, counters, task = std::move(task)]() {
        std::exception_ptr recovered;
        try {
            task();
        } catch (...) {
            recovered = std::current_exception();
        }

        if (!recovered) {
            counters->completed.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        counters->panicked.fetch_add(1, std::memory_order_relaxed);
        if (handler) {
            handler->HandlePanic(pool_name, recovered);
        } else {
            std::cerr << "[EXECUTOR PANIC] pool=" << pool_name
                      << " panic=" << DescribeException(recovered) << std::endl;
        }
    };
}

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
