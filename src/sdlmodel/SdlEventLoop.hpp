#pragma once

#include <functional>
#include <sdlmodel/sdlmodel.hpp>

namespace sdlmodel {

    // Event loop that pumps SDL events and wakes up on posted tasks through a registered user event.
    class SdlEventLoop : public QueuedEventLoop {
        uint32_t wakeUpEventType{0};
        std::function<void(const SDL_Event&)> onEvent;

    protected:
        void initializeOnUIThreadImpl() override;
        void pumpEvents() override;
        void waitForWork(std::chrono::milliseconds timeout) override;
        void wakeUp() override;

    public:
        explicit SdlEventLoop(std::function<void(const SDL_Event&)> onEvent);
    };

}
