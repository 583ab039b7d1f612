#include "execution/worker_pool.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace taskexec {
namespace engine {
namespace execution {

Status WorkerPool::Create(const std::string& pool_name,
                          size_t capacity,
                          std::chrono::milliseconds expiry,
                          bool non_blocking,
                          std::shared_ptr<WorkerPool>& pool) {
    if (capacity == 0) {
        return Status(WORKER_POOL_INVALID_ARGUMENT,
                      "worker pool '" + pool_name + "' must have a positive capacity");
    }
    if (expiry.count() <= 0) {
        return Status(WORKER_POOL_INVALID_ARGUMENT,
                      "worker pool '" + pool_name + "' must have a positive expiry");
    }
    pool.reset(new WorkerPool(pool_name, capacity, expiry, non_blocking));
    return Status::OK();
}

WorkerPool::WorkerPool(const std::string& pool_name, size_t capacity,
                       std::chrono::milliseconds expiry, bool non_blocking)
    : pool_name_(pool_name),
      capacity_(capacity),
      expiry_(expiry),
      non_blocking_(non_blocking) {
    logger_.Debug("Initializing worker pool '" + pool_name_ + "' with capacity " +
                  std::to_string(capacity_) + (non_blocking_ ? " (non-blocking)" : " (blocking)"));
}

WorkerPool::~WorkerPool() {
    Release();
}

Status WorkerPool::Submit(Task task) {
    if (!task) {
        return Status(WORKER_POOL_INVALID_ARGUMENT, "cannot submit an empty task");
    }

    JoinRetiredWorkers();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (closed_) {
            return Status(WORKER_POOL_CLOSED, "worker pool '" + pool_name_ + "' is closed");
        }

        if (in_flight_ >= capacity_) {
            if (non_blocking_) {
                return Status(WORKER_POOL_OVERLOAD, "worker pool '" + pool_name_ +
                              "' is at capacity (" + std::to_string(capacity_) + ")");
            }
            ++waiting_submitters_;
            slot_available_.wait(lock, [this] {
                return closed_ || in_flight_ < capacity_;
            });
            --waiting_submitters_;

            if (closed_) {
                return Status(WORKER_POOL_CLOSED, "worker pool '" + pool_name_ + "' is closed");
            }
        }

        ++in_flight_;
        tasks_.push_back(std::move(task));

        // Every queued task needs a waiting worker; start one when short.
        if (tasks_.size() > idle_workers_) {
            size_t worker_id = next_worker_id_++;
            std::thread& slot = workers_[worker_id];
            // A new worker counts as idle until it picks up a task.
            ++idle_workers_;
            try {
                slot = std::thread(&WorkerPool::WorkerLoop, this, worker_id);
            } catch (const std::system_error& e) {
                --idle_workers_;
                workers_.erase(worker_id);
                tasks_.pop_back();
                --in_flight_;
                slot_available_.notify_one();
                logger_.Error("Failed to start worker in pool '" + pool_name_ + "': " + e.what());
                return Status(WORKER_POOL_START_FAILED,
                              "failed to start worker in pool '" + pool_name_ + "': " + e.what());
            }
        }
    }

    task_available_.notify_one();
    return Status::OK();
}

void WorkerPool::Release() {
    std::unordered_map<size_t, std::thread> workers;
    std::vector<std::thread> retired;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        closed_ = true;
        workers.swap(workers_);
        retired.swap(retired_);
    }

    task_available_.notify_all();
    slot_available_.notify_all();

    if (workers.empty() && retired.empty()) {
        return;
    }

    for (auto& entry : workers) {
        JoinThread(entry.second);
    }
    for (auto& thread : retired) {
        JoinThread(thread);
    }

    logger_.Debug("Worker pool '" + pool_name_ + "' released");
}

size_t WorkerPool::Running() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return workers_.size();
}

size_t WorkerPool::Free() const {
    size_t running = Running();
    return running >= capacity_ ? 0 : capacity_ - running;
}

size_t WorkerPool::Waiting() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return waiting_submitters_;
}

bool WorkerPool::IsClosed() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return closed_;
}

void WorkerPool::WorkerLoop(size_t worker_id) {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    // idle_workers_ already includes this worker while it waits.
    while (true) {
        bool woken = task_available_.wait_for(lock, expiry_, [this] {
            return closed_ || !tasks_.empty();
        });

        if (!tasks_.empty()) {
            --idle_workers_;
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();

            try {
                task();
            } catch (const std::exception& e) {
                logger_.Error("Task escaped containment in pool '" + pool_name_ + "': " + e.what());
            } catch (...) {
                logger_.Error("Task escaped containment in pool '" + pool_name_ + "' with unknown error");
            }

            lock.lock();
            --in_flight_;
            ++idle_workers_;
            slot_available_.notify_one();
            continue;
        }

        if (closed_) {
            --idle_workers_;
            break;
        }

        if (!woken) {
            // Idle for a full expiry period: hand our thread over for joining.
            --idle_workers_;
            auto it = workers_.find(worker_id);
            if (it != workers_.end()) {
                retired_.push_back(std::move(it->second));
                workers_.erase(it);
            }
            logger_.Debug("Worker " + std::to_string(worker_id) + " in pool '" +
                          pool_name_ + "' expired");
            break;
        }
    }
}

void WorkerPool::JoinRetiredWorkers() {
    std::vector<std::thread> retired;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (retired_.empty()) {
            return;
        }
        retired.swap(retired_);
    }
    for (auto& thread : retired) {
        JoinThread(thread);
    }
}

void WorkerPool::JoinThread(std::thread& thread) {
    if (!thread.joinable()) {
        return;
    }
    // A task that drops the last reference to its own pool ends up here on
    // its worker thread.
    if (thread.get_id() == std::this_thread::get_id()) {
        thread.detach();
        return;
    }
    thread.join();
}

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
