#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "execution/panic_handler.hpp"
#include "execution/pool_wrapper.hpp"

using namespace taskexec;
using namespace taskexec::engine::execution;

namespace {

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

class RecordingPanicHandler : public PanicHandler {
public:
    void HandlePanic(const PoolName& pool_name, std::exception_ptr recovered) override {
        std::lock_guard<std::mutex> lock(mutex_);
        pools_.push_back(pool_name);
        messages_.push_back(DescribeException(recovered));
        cv_.notify_all();
    }

    bool WaitForPanics(size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [&] { return pools_.size() >= count; });
    }

    std::vector<PoolName> Pools() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pools_;
    }

    std::vector<std::string> Messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<PoolName> pools_;
    std::vector<std::string> messages_;
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

class PoolWrapperTest : public ::testing::Test {
protected:
    std::shared_ptr<PoolWrapper> MakeWrapper(const PoolConfig& config,
                                             std::shared_ptr<PanicHandler> handler = nullptr) {
        std::shared_ptr<PoolWrapper> wrapper;
        Status status = PoolWrapper::Create(config, std::move(handler), wrapper);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return wrapper;
    }
};

TEST_F(PoolWrapperTest, CreateRejectsEmptyName) {
    std::shared_ptr<PoolWrapper> wrapper;
    Status status = PoolWrapper::Create(PoolConfig("", 4), nullptr, wrapper);
    EXPECT_EQ(status.code(), INVALID_CONFIG);
    EXPECT_EQ(wrapper, nullptr);
}

TEST_F(PoolWrapperTest, CreateRepairsConfig) {
    auto wrapper = MakeWrapper(PoolConfig("tiny", 0, std::chrono::milliseconds(-1)));
    EXPECT_EQ(wrapper->Cap(), 1u);
    EXPECT_EQ(wrapper->GetConfig().size, 1);
    EXPECT_EQ(wrapper->GetConfig().expiry, DefaultWorkerExpiry);
    EXPECT_EQ(wrapper->GetName(), "tiny");
}

TEST_F(PoolWrapperTest, RunsTasksAndCounts) {
    auto wrapper = MakeWrapper(PoolConfig("work", 4, DefaultWorkerExpiry, false));
    std::atomic<int> counter{0};

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(wrapper->Submit([&counter]() { counter.fetch_add(1); }).ok());
    }
    ASSERT_TRUE(wrapper->ReleaseTimeout(std::chrono::seconds(5)).ok());

    EXPECT_EQ(counter.load(), 20);
    PoolStats stats = wrapper->GetStats();
    EXPECT_EQ(stats.name, "work");
    EXPECT_EQ(stats.capacity, 4u);
    EXPECT_FALSE(stats.non_blocking);
    EXPECT_EQ(stats.tasks_submitted, 20u);
    EXPECT_EQ(stats.tasks_completed, 20u);
    EXPECT_EQ(stats.tasks_panicked, 0u);
    EXPECT_EQ(stats.tasks_rejected, 0u);
}

TEST_F(PoolWrapperTest, EmptyTaskRejected) {
    auto wrapper = MakeWrapper(PoolConfig("p", 1));
    EXPECT_EQ(wrapper->Submit(Task()).code(), WORKER_POOL_INVALID_ARGUMENT);
}

TEST_F(PoolWrapperTest, OverloadTranslated) {
    auto wrapper = MakeWrapper(PoolConfig("busy", 1, DefaultWorkerExpiry, true));
    auto gate = std::make_shared<Gate>();

    ASSERT_TRUE(wrapper->Submit([gate]() { gate->Wait(); }).ok());
    Status status = wrapper->Submit([]() {});
    EXPECT_EQ(status.code(), POOL_OVERLOAD);
    EXPECT_EQ(status.message(), "pool overloaded");
    EXPECT_EQ(wrapper->GetStats().tasks_rejected, 1u);

    gate->Open();
    EXPECT_TRUE(wrapper->ReleaseTimeout(std::chrono::seconds(5)).ok());
}

TEST_F(PoolWrapperTest, ClosedTranslated) {
    auto wrapper = MakeWrapper(PoolConfig("gone", 2));
    ASSERT_TRUE(wrapper->ReleaseTimeout(std::chrono::seconds(5)).ok());

    Status status = wrapper->Submit([]() {});
    EXPECT_EQ(status.code(), MANAGER_CLOSED);
    EXPECT_EQ(status.message(), "manager is closed");
}

TEST_F(PoolWrapperTest, PanicGoesToHandler) {
    auto handler = std::make_shared<RecordingPanicHandler>();
    auto wrapper = MakeWrapper(PoolConfig("risky", 1, DefaultWorkerExpiry, false), handler);

    ASSERT_TRUE(wrapper->Submit([]() { throw std::runtime_error("boom"); }).ok());
    ASSERT_TRUE(handler->WaitForPanics(1));

    EXPECT_EQ(handler->Pools(), std::vector<PoolName>{"risky"});
    EXPECT_EQ(handler->Messages(), std::vector<std::string>{"boom"});

    // The worker survives and keeps serving.
    std::atomic<bool> ran{false};
    ASSERT_TRUE(wrapper->Submit([&ran]() { ran = true; }).ok());
    ASSERT_TRUE(wrapper->ReleaseTimeout(std::chrono::seconds(5)).ok());
    EXPECT_TRUE(ran.load());

    PoolStats stats = wrapper->GetStats();
    EXPECT_EQ(stats.tasks_panicked, 1u);
    EXPECT_EQ(stats.tasks_completed, 1u);
}

TEST_F(PoolWrapperTest, NonStandardExceptionsDescribed) {
    auto handler = std::make_shared<RecordingPanicHandler>();
    auto wrapper = MakeWrapper(PoolConfig("odd", 1, DefaultWorkerExpiry, false), handler);

    ASSERT_TRUE(wrapper->Submit([]() { throw std::string("text value"); }).ok());
    ASSERT_TRUE(wrapper->Submit([]() { throw 42; }).ok());
    ASSERT_TRUE(handler->WaitForPanics(2));
    ASSERT_TRUE(wrapper->ReleaseTimeout(std::chrono::seconds(5)).ok());

    std::vector<std::string> expected = {"text value", "unknown exception"};
    EXPECT_EQ(handler->Messages(), expected);
}

TEST_F(PoolWrapperTest, PanicWithoutHandlerWritesFallbackLine) {
    auto wrapper = MakeWrapper(PoolConfig("bare", 1, DefaultWorkerExpiry, false));

    testing::internal::CaptureStderr();
    ASSERT_TRUE(wrapper->Submit([]() { throw std::runtime_error("kaboom"); }).ok());
    ASSERT_TRUE(wrapper->ReleaseTimeout(std::chrono::seconds(5)).ok());
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("[EXECUTOR PANIC] pool=bare panic=kaboom"), std::string::npos) << output;
    EXPECT_EQ(wrapper->GetStats().tasks_panicked, 1u);
}

TEST_F(PoolWrapperTest, ReleaseTimeoutReportsSlowDrain) {
    auto wrapper = MakeWrapper(PoolConfig("slow", 1, DefaultWorkerExpiry, false));
    auto gate = std::make_shared<Gate>();

    ASSERT_TRUE(wrapper->Submit([gate]() { gate->Wait(); }).ok());

    auto start = std::chrono::steady_clock::now();
    Status status = wrapper->ReleaseTimeout(std::chrono::milliseconds(50));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(status.code(), SHUTDOWN_TIMEOUT);
    EXPECT_EQ(status.message(), "shutdown timeout exceeded (pool slow)");
    EXPECT_LT(elapsed, std::chrono::seconds(2));

    // The drain continues in the background and still finishes the task.
    gate->Open();
    EXPECT_TRUE(WaitUntil([&]() { return wrapper->GetStats().tasks_completed == 1; }));
    EXPECT_TRUE(WaitUntil([&]() { return wrapper->Running() == 0; }));
}
