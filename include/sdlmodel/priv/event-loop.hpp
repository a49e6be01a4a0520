#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace sdlmodel {

    // The loop owned by the application thread.
    //
    // Call `initializeOnUIThread()` once on the thread that runs the loop, and `start()` to run it.
    // It will then keep processing tasks until `stop()` is invoked (either from a task or from another thread).
    //
    // Derive from this class to plug in the source of native events; `QueuedEventLoop` provides
    // the task queue part and `SdlEventLoop` (in the implementation) pumps SDL events.
    class EventLoop {
    protected:
        virtual void initializeOnUIThreadImpl() = 0;
        virtual bool runningOnMainThreadImpl() = 0;
        virtual void enqueueTaskOnMainThreadImpl(std::function<void()>&& func) = 0;
        // Enqueues only while the loop runs. `func` is left untouched when refused.
        virtual bool tryEnqueueTaskOnMainThreadImpl(std::function<void()>&& func) {
            enqueueTaskOnMainThreadImpl(std::move(func));
            return true;
        }
        virtual void startImpl() = 0;
        virtual void stopImpl() = 0;
    public:
        virtual ~EventLoop() = default;

        void initializeOnUIThread() { initializeOnUIThreadImpl(); }
        bool runningOnMainThread() { return runningOnMainThreadImpl(); }
        // Run task either immediately (if current thread is the main thread) or on the main thread,
        // blocking until it finished. An exception thrown by the task is rethrown here.
        // Throws std::runtime_error when the loop no longer accepts tasks.
        void runTaskOnMainThread(std::function<void()>&& func) {
            if (runningOnMainThread()) {
                func();
                return;
            }
            auto done = std::make_shared<std::promise<void>>();
            auto future = done->get_future();
            std::function<void()> task = [done, func = std::move(func)]() {
                try {
                    func();
                } catch (...) {
                    done->set_exception(std::current_exception());
                    return;
                }
                done->set_value();
            };
            if (!tryEnqueueTaskOnMainThread(std::move(task)))
                throw std::runtime_error("The event loop is not running");
            future.get();
        }
        bool tryEnqueueTaskOnMainThread(std::function<void()>&& func) { return tryEnqueueTaskOnMainThreadImpl(std::move(func)); }
        // Enqueue task on the main thread to run asynchronously.
        void enqueueTaskOnMainThread(std::function<void()>&& func) { enqueueTaskOnMainThreadImpl(std::move(func)); }
        void start() { startImpl(); }
        void stop() { stopImpl(); }
    };

    // Task queue with delayed tasks. `start()` alternates pumping native events, running queued
    // tasks and waiting for more work until `stop()`.
    class QueuedEventLoop : public EventLoop {
        struct DelayedTask {
            std::chrono::steady_clock::time_point deadline;
            uint64_t serial;
            std::function<void()> func;
        };
        struct LaterFirst {
            bool operator()(const DelayedTask& a, const DelayedTask& b) const {
                return a.deadline != b.deadline ? a.deadline > b.deadline : a.serial > b.serial;
            }
        };

        std::queue<std::function<void()>> tasks_{};
        std::priority_queue<DelayedTask, std::vector<DelayedTask>, LaterFirst> delayed_{};
        uint64_t delayedSerial_{0};
        std::mutex taskMutex_{};
        std::condition_variable taskAvailable_{};
        std::thread::id mainThreadId_{};
        std::atomic<bool> shouldStop_{false};
        // changed under taskMutex_, so that no task is accepted after the final drain.
        std::atomic<bool> running_{false};

        void runTask(std::function<void()>& task);

    protected:
        void initializeOnUIThreadImpl() override;
        bool runningOnMainThreadImpl() override;
        void enqueueTaskOnMainThreadImpl(std::function<void()>&& func) override;
        bool tryEnqueueTaskOnMainThreadImpl(std::function<void()>&& func) override;
        void startImpl() override;
        void stopImpl() override;

        // Dispatches pending native events. Does nothing by default.
        virtual void pumpEvents() {}
        // Blocks until new work may be available or the timeout elapsed.
        virtual void waitForWork(std::chrono::milliseconds timeout);
        // Wakes up a thread blocked in `waitForWork()`.
        virtual void wakeUp();

        // Time until the earliest delayed task is due, capped to `limit`.
        std::chrono::milliseconds nextWaitDuration(std::chrono::milliseconds limit);

    public:
        ~QueuedEventLoop() override = default;

        void enqueueDelayedTaskOnMainThread(std::chrono::steady_clock::duration delay, std::function<void()>&& func);

        // Runs the queued tasks and the delayed tasks that are due. Returns the number of tasks run.
        size_t processQueuedTasks();

        bool running() const { return running_.load(); }
    };

}
