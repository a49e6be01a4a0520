#include <sdlmodel/sdlmodel.hpp>

void sdlmodel::QueuedEventLoop::initializeOnUIThreadImpl() {
    mainThreadId_ = std::this_thread::get_id();
}

bool sdlmodel::QueuedEventLoop::runningOnMainThreadImpl() {
    return std::this_thread::get_id() == mainThreadId_;
}

void sdlmodel::QueuedEventLoop::enqueueTaskOnMainThreadImpl(std::function<void()>&& func) {
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        tasks_.push(std::move(func));
    }
    wakeUp();
}

bool sdlmodel::QueuedEventLoop::tryEnqueueTaskOnMainThreadImpl(std::function<void()>&& func) {
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        if (!running_.load())
            return false;
        tasks_.push(std::move(func));
    }
    wakeUp();
    return true;
}

void sdlmodel::QueuedEventLoop::enqueueDelayedTaskOnMainThread(std::chrono::steady_clock::duration delay, std::function<void()>&& func) {
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        delayed_.push(DelayedTask{std::chrono::steady_clock::now() + delay, delayedSerial_++, std::move(func)});
    }
    wakeUp();
}

void sdlmodel::QueuedEventLoop::runTask(std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        Logger::global()->logError("Task on the event loop failed: %s", e.what());
    }
}

size_t sdlmodel::QueuedEventLoop::processQueuedTasks() {
    std::queue<std::function<void()>> tasksToRun;
    std::vector<std::function<void()>> dueTasks;
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        std::swap(tasksToRun, tasks_);
        auto now = std::chrono::steady_clock::now();
        while (!delayed_.empty() && delayed_.top().deadline <= now) {
            dueTasks.emplace_back(delayed_.top().func);
            delayed_.pop();
        }
    }

    size_t count = tasksToRun.size() + dueTasks.size();
    while (!tasksToRun.empty()) {
        runTask(tasksToRun.front());
        tasksToRun.pop();
    }
    for (auto& task : dueTasks)
        runTask(task);
    return count;
}

std::chrono::milliseconds sdlmodel::QueuedEventLoop::nextWaitDuration(std::chrono::milliseconds limit) {
    std::lock_guard<std::mutex> lock(taskMutex_);
    if (!tasks_.empty())
        return std::chrono::milliseconds{0};
    if (delayed_.empty())
        return limit;
    auto untilDue = std::chrono::ceil<std::chrono::milliseconds>(delayed_.top().deadline - std::chrono::steady_clock::now());
    if (untilDue.count() < 0)
        return std::chrono::milliseconds{0};
    return std::min(untilDue, limit);
}

void sdlmodel::QueuedEventLoop::waitForWork(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(taskMutex_);
    taskAvailable_.wait_for(lock, timeout, [this] { return !tasks_.empty() || shouldStop_.load(); });
}

void sdlmodel::QueuedEventLoop::wakeUp() {
    taskAvailable_.notify_all();
}

void sdlmodel::QueuedEventLoop::startImpl() {
    shouldStop_.store(false);
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        running_.store(true);
    }
    while (!shouldStop_.load()) {
        pumpEvents();
        processQueuedTasks();
        if (shouldStop_.load())
            break;
        waitForWork(nextWaitDuration(std::chrono::milliseconds{100}));
    }
    {
        std::lock_guard<std::mutex> lock(taskMutex_);
        running_.store(false);
    }
    // run whatever got posted while stopping, so that no `send` stays blocked.
    processQueuedTasks();
}

void sdlmodel::QueuedEventLoop::stopImpl() {
    shouldStop_.store(true);
    wakeUp();
}
