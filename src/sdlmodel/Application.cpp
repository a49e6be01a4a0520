#include <mutex>
#include <thread>
#include <sdlmodel/sdlmodel.hpp>
#include "SdlEventLoop.hpp"

static std::atomic<sdlmodel::Application*> current_application{nullptr};

// the thread of the application made by Application::start(), if any. The thread only disposes the
// application; the object stays valid until the next start() or process exit.
struct StartedThread {
    std::thread thread{};
    std::unique_ptr<sdlmodel::Application> app{};
    ~StartedThread() {
        if (thread.joinable())
            thread.join();
    }
};
static std::mutex started_thread_mutex{};
static StartedThread started_app_thread{};

class sdlmodel::Application::Impl {
public:
    Application* owner;
    SDL_InitFlags flags;
    std::atomic<bool> disposed{false};
    SdlEventLoop loop;
    CopyOnWriteList<std::shared_ptr<Window>> windows{};
    ResourceTracker resources{};
    EventHandlers<Application> events{};
    EventHandlers<Window> windowEvents{};

    Impl(Application* owner, SDL_InitFlags flags) :
        owner(owner), flags(flags),
        loop([owner](const SDL_Event& e) { owner->dispatchEvent(e); }) {
    }
};

sdlmodel::Application::Application(SDL_InitFlags flags) {
    Application* expected{nullptr};
    if (!current_application.compare_exchange_strong(expected, this)) {
        Logger::global()->logError("An application already exists.");
        throw std::runtime_error("An application already exists.");
    }

    // the events subsystem is needed for the event loop.
    if (!SDL_Init(flags | SDL_INIT_EVENTS)) {
        current_application.store(nullptr);
        Logger::global()->logError("SDL_Init failed: %s", SDL_GetError());
        throw std::runtime_error(std::format("SDL_Init failed: {}", SDL_GetError()));
    }
    Logger::captureSdlLogOutput();

    impl = new Impl(this, flags);
    impl->loop.initializeOnUIThread();
}

sdlmodel::Application::~Application() {
    dispose();
    delete impl;
}

sdlmodel::Application* sdlmodel::Application::current() {
    return current_application.load();
}

SDL_InitFlags sdlmodel::Application::initFlags() const {
    return impl->flags;
}

bool sdlmodel::Application::disposed() const {
    return impl->disposed.load();
}

void sdlmodel::Application::dispose() {
    if (impl->disposed.exchange(true))
        return;
    impl->loop.stop();
    for (auto& window : *impl->windows.snapshot())
        window->dispose();
    impl->resources.disposeAll();
    SDL_SetLogOutputFunction(SDL_GetDefaultLogOutputFunction(), nullptr);
    SDL_Quit();
    Application* self{this};
    current_application.compare_exchange_strong(self, nullptr);
}

// Event loop -----------------------------------------------------------------

void sdlmodel::Application::run() {
    if (disposed())
        return;
    impl->loop.initializeOnUIThread();
    impl->loop.start();
}

void sdlmodel::Application::quit() {
    if (!disposed()) {
        SDL_Event e{};
        e.type = SDL_EVENT_QUIT;
        if (!SDL_PushEvent(&e))
            impl->loop.stop();
    }

    std::lock_guard<std::mutex> lock(started_thread_mutex);
    if (started_app_thread.thread.joinable() && started_app_thread.thread.get_id() != std::this_thread::get_id())
        started_app_thread.thread.join();
}

bool sdlmodel::Application::running() const {
    return impl->loop.running();
}

sdlmodel::QueuedEventLoop& sdlmodel::Application::eventLoop() {
    return impl->loop;
}

sdlmodel::Application* sdlmodel::Application::start(SDL_InitFlags flags) {
    auto started = std::make_shared<std::promise<Application*>>();
    auto future = started->get_future();

    std::lock_guard<std::mutex> lock(started_thread_mutex);
    // a previous application that quit from its own thread is finishing.
    if (started_app_thread.thread.joinable() && current() == nullptr)
        started_app_thread.thread.join();
    if (started_app_thread.thread.joinable())
        throw std::runtime_error("An application thread is already running.");
    started_app_thread.app.reset();
    started_app_thread.thread = std::thread([flags, started] {
        setCurrentThreadNameIfPossible("sdlmodel-app");
        Application* instance{};
        try {
            instance = new Application(flags);
        } catch (const std::exception&) {
            started->set_exception(std::current_exception());
            return;
        }
        // fulfilled from within the running loop.
        instance->eventLoop().enqueueTaskOnMainThread([started, instance] { started->set_value(instance); });
        instance->run();
        // SDL_Quit() has to run on the thread that called SDL_Init().
        instance->dispose();
    });
    try {
        started_app_thread.app.reset(future.get());
        return started_app_thread.app.get();
    } catch (const std::exception&) {
        started_app_thread.thread.join();
        throw;
    }
}

bool sdlmodel::Application::post(std::function<void()>&& task) {
    if (impl->loop.tryEnqueueTaskOnMainThread(std::move(task)))
        return true;
    if (impl->loop.runningOnMainThread()) {
        task();
        return true;
    }
    Logger::global()->logDiagnostic("Dropped a task posted after the event loop stopped.");
    return false;
}

std::future<void> sdlmodel::Application::postAsync(std::function<void()> task) {
    auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
    auto ret = packaged->get_future();
    post([packaged] { (*packaged)(); });
    return ret;
}

void sdlmodel::Application::send(std::function<void()>&& task) {
    if (!impl->loop.runningOnMainThread() && !running()) {
        Logger::global()->logError("Cannot send a task: the event loop is not running.");
        throw std::runtime_error("Cannot send a task: the event loop is not running.");
    }
    impl->loop.runTaskOnMainThread(std::move(task));
}

// Windows and resources ------------------------------------------------------

sdlmodel::Window* sdlmodel::Application::createWindow(int width, int height, SDL_WindowFlags flags, const std::string& title) {
    if (disposed())
        throw std::runtime_error("Cannot create a window on a disposed application");
    std::shared_ptr<Window> window{};
    send([&] { window = std::make_shared<Window>(this, title, width, height, flags); });
    impl->windows.add(window);
    return window.get();
}

std::vector<sdlmodel::Window*> sdlmodel::Application::windows() const {
    std::vector<Window*> ret{};
    for (auto& window : *impl->windows.snapshot())
        if (!window->disposed())
            ret.emplace_back(window.get());
    return ret;
}

sdlmodel::Window* sdlmodel::Application::findWindow(SDL_WindowID id) const {
    for (auto& window : *impl->windows.snapshot())
        if (window->id() == id && !window->disposed())
            return window.get();
    return nullptr;
}

void sdlmodel::Application::trackResource(std::weak_ptr<Disposable> resource) {
    impl->resources.track(std::move(resource));
}

size_t sdlmodel::Application::liveResourceCount() const {
    return impl->resources.liveCount();
}

// Events ---------------------------------------------------------------------

sdlmodel::EventHandlers<sdlmodel::Application>& sdlmodel::Application::events() {
    return impl->events;
}

sdlmodel::EventHandlers<sdlmodel::Window>& sdlmodel::Application::windowEvents() {
    return impl->windowEvents;
}

void sdlmodel::Application::dispatchEvent(const SDL_Event& e) {
    if (auto decoded = decodeEvent(e))
        dispatchEvent(*decoded);
}

void sdlmodel::Application::dispatchEvent(const Event& e) {
    auto windowId = eventWindowId(e);
    if (windowId && *windowId != 0) {
        auto window = findWindow(*windowId);
        if (!window) {
            Logger::global()->logWarning("Dropped %s event for unknown window %u", eventKindName(eventKind(e)), *windowId);
            return;
        }
        window->dispatchEvent(e, &impl->windowEvents);
        return;
    }

    impl->events.dispatch(*this, e);
    if (eventKind(e) == EventKind::Quit)
        impl->loop.stop();
}
