#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "execution/executor_types.hpp"
#include "logger/logger.hpp"
#include "utils/status.hpp"

namespace taskexec {
namespace engine {
namespace execution {

/**
 * @brief Bounded worker pool
 *
 * Runs submitted tasks on at most `capacity` worker threads. Workers are
 * started on demand and exit after staying idle for `expiry`.
 *
 * When `capacity` tasks are already accepted and unfinished:
 * - a non-blocking pool fails the submission with WORKER_POOL_OVERLOAD
 * - a blocking pool makes the submitter wait for a free slot
 *
 * Release() closes the pool, lets every accepted task finish and joins the
 * workers. Submissions after that fail with WORKER_POOL_CLOSED.
 */
class WorkerPool {
public:
    static Status Create(const std::string& pool_name,
                         size_t capacity,
                         std::chrono::milliseconds expiry,
                         bool non_blocking,
                         std::shared_ptr<WorkerPool>& pool);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    Status Submit(Task task);

    /**
     * @brief Close the pool and block until all accepted tasks have run
     *
     * Blocked submitters are woken and get WORKER_POOL_CLOSED. Calling it
     * again after the first call returned is a no-op.
     */
    void Release();

    // Live worker threads, busy or idle.
    size_t Running() const;
    size_t Free() const;
    size_t Cap() const { return capacity_; }
    // Submitters blocked on a full pool.
    size_t Waiting() const;
    bool IsClosed() const;

    const std::string& GetName() const { return pool_name_; }
    bool IsNonBlocking() const { return non_blocking_; }
    std::chrono::milliseconds GetExpiry() const { return expiry_; }

private:
    WorkerPool(const std::string& pool_name, size_t capacity,
               std::chrono::milliseconds expiry, bool non_blocking);

    void WorkerLoop(size_t worker_id);
    void JoinRetiredWorkers();
    static void JoinThread(std::thread& thread);

    std::string pool_name_;
    size_t capacity_;
    std::chrono::milliseconds expiry_;
    bool non_blocking_;

    mutable std::mutex queue_mutex_;
    std::condition_variable task_available_;
    std::condition_variable slot_available_;

    std::deque<Task> tasks_;
    size_t in_flight_ = 0;          // accepted and not yet finished
    size_t idle_workers_ = 0;
    size_t waiting_submitters_ = 0;
    size_t next_worker_id_ = 0;
    bool closed_ = false;

    std::unordered_map<size_t, std::thread> workers_;
    std::vector<std::thread> retired_;  // expired workers awaiting join

    Logger logger_;
};

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
