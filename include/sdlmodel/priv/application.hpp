#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <SDL3/SDL.h>
#include "disposable.hpp"
#include "event-loop.hpp"
#include "events.hpp"

namespace sdlmodel {

    class Window;

    // The SDL application. Only one instance can exist at a time.
    //
    // It initializes SDL, owns the windows and tracks surfaces, and runs the event loop
    // (`run()`) on the thread that should own all SDL video calls. Other threads reach that
    // thread through `post()`, `postAsync()` and `send()`.
    // Disposing (or destroying) it disposes windows, then tracked resources, then quits SDL.
    class Application {
    public:
        class Impl;

        static constexpr SDL_InitFlags DefaultInitFlags = SDL_INIT_VIDEO | SDL_INIT_AUDIO;

        // Throws std::runtime_error when another application exists or SDL cannot be initialized.
        explicit Application(SDL_InitFlags flags = DefaultInitFlags);
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        // nullptr when there is no application.
        static Application* current();
        // Creates an application on a dedicated thread and returns once its loop runs.
        // `quit()` on it stops the loop and joins that thread, which disposes the application there.
        // The returned object stays valid (disposed) until the next start() or process exit.
        static Application* start(SDL_InitFlags flags = DefaultInitFlags);

        SDL_InitFlags initFlags() const;
        bool disposed() const;
        void dispose();

        // Runs the event loop on the calling thread until the quit event is dispatched.
        void run();
        // Requests the loop to quit (thread safe).
        void quit();
        bool running() const;
        QueuedEventLoop& eventLoop();

        // Runs the task on the loop thread without waiting. On the loop thread it is invoked
        // immediately if the loop is not running. From other threads it is dropped once the loop
        // has stopped, and false is returned.
        bool post(std::function<void()>&& task);
        // The future reports std::future_error (broken promise) when the task was dropped.
        std::future<void> postAsync(std::function<void()> task);
        // Runs the task on the loop thread and waits for it, rethrowing its exception.
        // Throws std::runtime_error when called from another thread after the loop stopped.
        void send(std::function<void()>&& task);

        // Throws std::runtime_error when SDL cannot create the window or its renderer.
        Window* createWindow(int width, int height, SDL_WindowFlags flags = SDL_WINDOW_RESIZABLE, const std::string& title = "");
        // Live (not disposed) windows.
        std::vector<Window*> windows() const;
        Window* findWindow(SDL_WindowID id) const;

        void trackResource(std::weak_ptr<Disposable> resource);
        size_t liveResourceCount() const;

        // Handlers for events that are not routed to a window.
        EventHandlers<Application>& events();
        // Handlers invoked for events of every window, after the window's own handlers.
        EventHandlers<Window>& windowEvents();

        void dispatchEvent(const Event& e);
        void dispatchEvent(const SDL_Event& e);

    private:
        Impl* impl{};
    };

}
