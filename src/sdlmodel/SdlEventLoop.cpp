#include "SdlEventLoop.hpp"

sdlmodel::SdlEventLoop::SdlEventLoop(std::function<void(const SDL_Event&)> onEvent) :
    onEvent(std::move(onEvent)) {
}

void sdlmodel::SdlEventLoop::initializeOnUIThreadImpl() {
    QueuedEventLoop::initializeOnUIThreadImpl();
    if (wakeUpEventType == 0) {
        wakeUpEventType = SDL_RegisterEvents(1);
        if (wakeUpEventType == 0)
            Logger::global()->logWarning("Cannot register the wake-up event; posted tasks wait for the next poll.");
    }
}

void sdlmodel::SdlEventLoop::pumpEvents() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        if (wakeUpEventType != 0 && e.type == wakeUpEventType)
            continue;
        onEvent(e);
    }
}

void sdlmodel::SdlEventLoop::waitForWork(std::chrono::milliseconds timeout) {
    SDL_WaitEventTimeout(nullptr, static_cast<Sint32>(timeout.count()));
}

void sdlmodel::SdlEventLoop::wakeUp() {
    if (wakeUpEventType == 0)
        return;
    SDL_Event e{};
    e.type = wakeUpEventType;
    SDL_PushEvent(&e);
}
