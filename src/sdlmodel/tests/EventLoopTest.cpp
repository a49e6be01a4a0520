#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <sdlmodel/sdlmodel.hpp>

using namespace std::chrono_literals;

namespace {

// Runs a QueuedEventLoop on its own thread for the duration of a test.
class EventLoopTest : public ::testing::Test {
protected:
    sdlmodel::QueuedEventLoop loop{};
    std::thread loopThread{};
    std::thread::id loopThreadId{};

    void SetUp() override {
        std::atomic<bool> initialized{false};
        loopThread = std::thread([this, &initialized] {
            loop.initializeOnUIThread();
            loopThreadId = std::this_thread::get_id();
            initialized.store(true);
            initialized.notify_one();
            loop.start();
        });
        initialized.wait(false);
        while (!loop.running())
            std::this_thread::sleep_for(1ms);
    }

    void TearDown() override {
        loop.stop();
        if (loopThread.joinable())
            loopThread.join();
    }
};

}

TEST_F(EventLoopTest, EnqueuedTaskRunsOnLoopThread) {
    std::atomic<bool> done{false};
    std::thread::id ranOn{};
    loop.enqueueTaskOnMainThread([&] {
        ranOn = std::this_thread::get_id();
        done.store(true);
        done.notify_one();
    });
    done.wait(false);
    EXPECT_EQ(ranOn, loopThreadId);
    EXPECT_FALSE(loop.runningOnMainThread());
}

TEST_F(EventLoopTest, RunTaskBlocksUntilDone) {
    int value = 0;
    loop.runTaskOnMainThread([&] {
        std::this_thread::sleep_for(20ms);
        value = 42;
    });
    EXPECT_EQ(value, 42);
}

TEST_F(EventLoopTest, RunTaskRethrowsOnCaller) {
    EXPECT_THROW(loop.runTaskOnMainThread([] { throw std::runtime_error("failed on the loop"); }), std::runtime_error);
    // the loop keeps running after a failing task.
    bool ran = false;
    loop.runTaskOnMainThread([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(EventLoopTest, FailingPostedTaskDoesNotStopLoop) {
    loop.enqueueTaskOnMainThread([] { throw std::runtime_error("ignored"); });
    bool ran = false;
    loop.runTaskOnMainThread([&] { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_TRUE(loop.running());
}

TEST_F(EventLoopTest, DelayedTasksRunInDeadlineOrder) {
    std::mutex mutex{};
    std::vector<int> order{};
    std::atomic<int> count{0};
    auto record = [&](int n) {
        return [&, n] {
            {
                std::lock_guard lock(mutex);
                order.push_back(n);
            }
            count++;
            count.notify_one();
        };
    };
    loop.enqueueDelayedTaskOnMainThread(60ms, record(3));
    loop.enqueueDelayedTaskOnMainThread(20ms, record(1));
    loop.enqueueDelayedTaskOnMainThread(40ms, record(2));

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (count.load() < 3 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);

    std::lock_guard lock(mutex);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(EventLoopTest, DelayedTaskWaitsForItsDeadline) {
    std::atomic<bool> done{false};
    auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point ranAt{};
    loop.enqueueDelayedTaskOnMainThread(50ms, [&] {
        ranAt = std::chrono::steady_clock::now();
        done.store(true);
        done.notify_one();
    });
    done.wait(false);
    EXPECT_GE(ranAt - start, 50ms);
}

TEST(QueuedEventLoopTest, ProcessQueuedTasksWithoutRunningLoop) {
    sdlmodel::QueuedEventLoop loop{};
    loop.initializeOnUIThread();
    int count = 0;
    loop.enqueueTaskOnMainThread([&] { count++; });
    loop.enqueueTaskOnMainThread([&] { count++; });
    loop.enqueueDelayedTaskOnMainThread(1h, [&] { count += 100; });
    EXPECT_EQ(loop.processQueuedTasks(), 2u);
    EXPECT_EQ(count, 2);
    EXPECT_EQ(loop.processQueuedTasks(), 0u);
}

TEST(QueuedEventLoopTest, RunTaskOnLoopThreadRunsInline) {
    sdlmodel::QueuedEventLoop loop{};
    loop.initializeOnUIThread();
    bool ran = false;
    loop.runTaskOnMainThread([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(QueuedEventLoopTest, RefusesTasksFromOtherThreadsOnceStopped) {
    sdlmodel::QueuedEventLoop loop{};
    EXPECT_FALSE(loop.tryEnqueueTaskOnMainThread([] {}));

    std::thread loopThread([&] {
        loop.initializeOnUIThread();
        loop.start();
    });
    while (!loop.running())
        std::this_thread::sleep_for(1ms);
    bool ran = false;
    loop.runTaskOnMainThread([&] { ran = true; });
    EXPECT_TRUE(ran);

    loop.stop();
    loopThread.join();
    bool ranLate = false;
    std::function<void()> late = [&] { ranLate = true; };
    EXPECT_FALSE(loop.tryEnqueueTaskOnMainThread(std::move(late)));
    // a refused task is handed back untouched.
    ASSERT_TRUE(late);
    EXPECT_THROW(loop.runTaskOnMainThread([&] { ranLate = true; }), std::runtime_error);
    EXPECT_EQ(loop.processQueuedTasks(), 0u);
    EXPECT_FALSE(ranLate);
}

TEST_F(EventLoopTest, RunTaskFromManyThreads) {
    std::atomic<int> count{0};
    std::vector<std::thread> callers{};
    for (int i = 0; i < 8; i++)
        callers.emplace_back([&] {
            for (int j = 0; j < 50; j++)
                loop.runTaskOnMainThread([&] { count++; });
        });
    for (auto& t : callers)
        t.join();
    EXPECT_EQ(count.load(), 400);
}

TEST(PeriodicTimerTest, NextPeriodDelayIsWithinPeriod) {
    sdlmodel::PeriodicTimer timer{10ms};
    auto delay = timer.nextPeriodDelay();
    EXPECT_GT(delay, 0ms);
    EXPECT_LE(delay, 10ms);
}

TEST(PeriodicTimerTest, WaitReturnsFalseWhenCancelled) {
    sdlmodel::PeriodicTimer timer{10ms};
    sdlmodel::CancellationSource source{};
    source.cancel();
    EXPECT_FALSE(timer.waitForNextPeriod(source.token()));
    EXPECT_TRUE(timer.waitForNextPeriod());
}

TEST_F(EventLoopTest, PeriodicEventTicksUntilStopped) {
    std::atomic<int> ticks{0};
    sdlmodel::PeriodicEvent periodic{5ms, [&](std::chrono::nanoseconds, const sdlmodel::CancellationToken&) { ticks++; }};
    periodic.start(loop);
    EXPECT_TRUE(periodic.started());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (ticks.load() < 3 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(2ms);
    EXPECT_GE(ticks.load(), 3);

    loop.runTaskOnMainThread([&] { periodic.stop(); });
    auto stoppedAt = ticks.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(ticks.load(), stoppedAt);
    EXPECT_FALSE(periodic.started());
}
