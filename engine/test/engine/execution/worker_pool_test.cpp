/**
 * @file worker_pool_test.cpp
 * @brief Unit tests for the bounded worker pool
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "execution/worker_pool.hpp"

using namespace taskexec;
using namespace taskexec::engine::execution;

namespace {

// Holds tasks until Open() is called.
class Gate {
public:
    void Wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    void Open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

template <typename Predicate>
bool WaitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

}  // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    std::shared_ptr<WorkerPool> MakePool(size_t capacity, bool non_blocking,
                                         std::chrono::milliseconds expiry = std::chrono::seconds(10)) {
        std::shared_ptr<WorkerPool> pool;
        Status status = WorkerPool::Create("test", capacity, expiry, non_blocking, pool);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return pool;
    }
};

TEST_F(WorkerPoolTest, CreateRejectsInvalidArguments) {
    std::shared_ptr<WorkerPool> pool;
    EXPECT_EQ(WorkerPool::Create("zero", 0, std::chrono::seconds(1), true, pool).code(),
              WORKER_POOL_INVALID_ARGUMENT);
    EXPECT_EQ(WorkerPool::Create("expiry", 1, std::chrono::milliseconds(0), true, pool).code(),
              WORKER_POOL_INVALID_ARGUMENT);
    EXPECT_EQ(pool, nullptr);
}

TEST_F(WorkerPoolTest, ReportsConfiguration) {
    auto pool = MakePool(4, false, std::chrono::milliseconds(250));
    EXPECT_EQ(pool->GetName(), "test");
    EXPECT_EQ(pool->Cap(), 4u);
    EXPECT_FALSE(pool->IsNonBlocking());
    EXPECT_EQ(pool->GetExpiry(), std::chrono::milliseconds(250));
    EXPECT_EQ(pool->Running(), 0u);
    EXPECT_EQ(pool->Free(), 4u);
    EXPECT_FALSE(pool->IsClosed());
}

TEST_F(WorkerPoolTest, RunsAllSubmittedTasks) {
    auto pool = MakePool(4, false);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool->Submit([&counter]() { counter.fetch_add(1); }).ok());
    }

    pool->Release();
    EXPECT_EQ(counter.load(), 100);
}

TEST_F(WorkerPoolTest, EmptyTaskRejected) {
    auto pool = MakePool(1, true);
    EXPECT_EQ(pool->Submit(Task()).code(), WORKER_POOL_INVALID_ARGUMENT);
}

TEST_F(WorkerPoolTest, NonBlockingPoolRejectsWhenFull) {
    auto pool = MakePool(2, true);
    Gate gate;

    ASSERT_TRUE(pool->Submit([&gate]() { gate.Wait(); }).ok());
    ASSERT_TRUE(pool->Submit([&gate]() { gate.Wait(); }).ok());

    Status status = pool->Submit([]() {});
    EXPECT_EQ(status.code(), WORKER_POOL_OVERLOAD);

    gate.Open();
    pool->Release();
}

TEST_F(WorkerPoolTest, NonBlockingPoolAcceptsAgainAfterCompletion) {
    auto pool = MakePool(1, true);
    std::promise<void> done;
    ASSERT_TRUE(pool->Submit([&done]() { done.set_value(); }).ok());
    done.get_future().wait();

    // The slot is returned right after the task body finishes.
    std::atomic<bool> ran{false};
    ASSERT_TRUE(WaitUntil([&]() { return pool->Submit([&ran]() { ran = true; }).ok(); }));
    pool->Release();
    EXPECT_TRUE(ran.load());
}

TEST_F(WorkerPoolTest, BlockingPoolWaitsForFreeSlot) {
    auto pool = MakePool(1, false);
    Gate gate;
    std::atomic<int> completed{0};

    ASSERT_TRUE(pool->Submit([&]() {
        gate.Wait();
        completed.fetch_add(1);
    }).ok());

    auto blocked = std::async(std::launch::async, [&]() {
        return pool->Submit([&completed]() { completed.fetch_add(1); });
    });

    ASSERT_TRUE(WaitUntil([&]() { return pool->Waiting() == 1; }));
    EXPECT_EQ(blocked.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

    gate.Open();
    EXPECT_TRUE(blocked.get().ok());

    pool->Release();
    EXPECT_EQ(completed.load(), 2);
    EXPECT_EQ(pool->Waiting(), 0u);
}

TEST_F(WorkerPoolTest, ConcurrencyNeverExceedsCapacity) {
    auto pool = MakePool(3, false);
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(pool->Submit([&]() {
            int now = active.fetch_add(1) + 1;
            int seen = max_active.load();
            while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            active.fetch_sub(1);
        }).ok());
        EXPECT_LE(pool->Running(), 3u);
    }

    pool->Release();
    EXPECT_LE(max_active.load(), 3);
    EXPECT_GE(max_active.load(), 1);
}

TEST_F(WorkerPoolTest, ReleaseDrainsAcceptedTasks) {
    auto pool = MakePool(4, true);
    std::atomic<int> counter{0};

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(pool->Submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            counter.fetch_add(1);
        }).ok());
    }

    pool->Release();
    EXPECT_EQ(counter.load(), 4);
    EXPECT_TRUE(pool->IsClosed());
    EXPECT_EQ(pool->Running(), 0u);
}

TEST_F(WorkerPoolTest, SubmitAfterReleaseFails) {
    auto pool = MakePool(2, true);
    pool->Release();

    EXPECT_EQ(pool->Submit([]() {}).code(), WORKER_POOL_CLOSED);
    // Second release is a no-op.
    pool->Release();
}

TEST_F(WorkerPoolTest, ReleaseWakesBlockedSubmitters) {
    auto pool = MakePool(1, false);
    Gate gate;
    ASSERT_TRUE(pool->Submit([&gate]() { gate.Wait(); }).ok());

    auto blocked = std::async(std::launch::async, [&]() {
        return pool->Submit([]() {});
    });
    ASSERT_TRUE(WaitUntil([&]() { return pool->Waiting() == 1; }));

    auto releaser = std::async(std::launch::async, [&]() { pool->Release(); });

    EXPECT_EQ(blocked.get().code(), WORKER_POOL_CLOSED);
    gate.Open();
    releaser.get();
}

TEST_F(WorkerPoolTest, IdleWorkersExpire) {
    auto pool = MakePool(2, true, std::chrono::milliseconds(50));
    std::promise<void> done;

    ASSERT_TRUE(pool->Submit([&done]() { done.set_value(); }).ok());
    done.get_future().wait();
    EXPECT_LE(pool->Running(), 1u);

    EXPECT_TRUE(WaitUntil([&]() { return pool->Running() == 0; }));
    EXPECT_EQ(pool->Free(), 2u);

    // The pool keeps working after its workers expired.
    std::promise<void> again;
    ASSERT_TRUE(pool->Submit([&again]() { again.set_value(); }).ok());
    EXPECT_EQ(again.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    pool->Release();
}

TEST_F(WorkerPoolTest, EscapingExceptionDoesNotKillWorker) {
    auto pool = MakePool(1, false);
    std::atomic<int> counter{0};

    ASSERT_TRUE(pool->Submit([]() { throw std::runtime_error("boom"); }).ok());
    ASSERT_TRUE(pool->Submit([&counter]() { counter.fetch_add(1); }).ok());

    pool->Release();
    EXPECT_EQ(counter.load(), 1);
}
