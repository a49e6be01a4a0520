#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include "cancellation.hpp"
#include "event-loop.hpp"

namespace sdlmodel {

    // Period boundaries aligned to a start time, so that late ticks do not drift.
    class PeriodicTimer {
    public:
        using Clock = std::chrono::steady_clock;

        explicit PeriodicTimer(Clock::duration period) : period(period), startTime(Clock::now()) {}

        Clock::duration period;
        Clock::time_point startTime;

        Clock::duration elapsed() const { return Clock::now() - startTime; }
        // Time left until the start of the next period.
        Clock::duration nextPeriodDelay() const;
        // Blocks the calling thread until the next period starts. Returns false if cancelled meanwhile.
        bool waitForNextPeriod(const CancellationToken& token = {}) const;
    };

    // Invokes a handler on an event loop once per period until stopped.
    class PeriodicEvent {
    public:
        using Handler = std::function<void(std::chrono::nanoseconds sinceStart, const CancellationToken& token)>;

    private:
        struct State {
            PeriodicTimer timer;
            Handler handler;
            CancellationSource cancellation{};
        };
        PeriodicTimer::Clock::duration period_;
        Handler handler_;
        std::shared_ptr<State> running_{};

        static void tick(QueuedEventLoop* loop, std::shared_ptr<State> state);

    public:
        PeriodicEvent(PeriodicTimer::Clock::duration period, Handler handler);
        ~PeriodicEvent();

        PeriodicTimer::Clock::duration period() const { return period_; }
        bool started() const { return running_ != nullptr; }

        // Starts ticking on `loop`. Does nothing if already started.
        void start(QueuedEventLoop& loop);
        // Cancels the pending ticks. A handler that is running observes the cancelled token.
        void stop();
    };

}
