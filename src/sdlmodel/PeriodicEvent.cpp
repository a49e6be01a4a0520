#include <thread>
#include <sdlmodel/sdlmodel.hpp>

sdlmodel::PeriodicTimer::Clock::duration sdlmodel::PeriodicTimer::nextPeriodDelay() const {
    if (period <= Clock::duration::zero())
        return Clock::duration::zero();
    auto sinceStart = elapsed();
    auto nthPeriod = sinceStart / period;
    return (nthPeriod + 1) * period - sinceStart;
}

bool sdlmodel::PeriodicTimer::waitForNextPeriod(const CancellationToken& token) const {
    if (token.cancelled())
        return false;
    std::this_thread::sleep_for(nextPeriodDelay());
    return !token.cancelled();
}

sdlmodel::PeriodicEvent::PeriodicEvent(PeriodicTimer::Clock::duration period, Handler handler) :
    period_(period), handler_(std::move(handler)) {
}

sdlmodel::PeriodicEvent::~PeriodicEvent() {
    stop();
}

void sdlmodel::PeriodicEvent::start(QueuedEventLoop& loop) {
    if (running_)
        return;
    running_ = std::make_shared<State>(State{PeriodicTimer{period_}, handler_});
    loop.enqueueTaskOnMainThread([loop = &loop, state = running_] { tick(loop, state); });
}

void sdlmodel::PeriodicEvent::stop() {
    if (auto state = std::exchange(running_, nullptr))
        state->cancellation.cancel();
}

void sdlmodel::PeriodicEvent::tick(QueuedEventLoop* loop, std::shared_ptr<State> state) {
    auto token = state->cancellation.token();
    if (token.cancelled())
        return;
    try {
        state->handler(std::chrono::duration_cast<std::chrono::nanoseconds>(state->timer.elapsed()), token);
    } catch (const std::exception& e) {
        Logger::global()->logError("Periodic event handler failed: %s", e.what());
    }
    if (token.cancelled())
        return;
    loop->enqueueDelayedTaskOnMainThread(state->timer.nextPeriodDelay(), [loop, state] { tick(loop, state); });
}
