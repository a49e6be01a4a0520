#include <sdlmodel-scenes/sdlmodel-scenes.hpp>

std::unique_ptr<sdlmodel::scenes::Graphics> sdlmodel::scenes::Graphics::init(int width, int height,
                                                                              SDL_WindowFlags windowFlags, SDL_InitFlags sdlFlags) {
    auto application = Application::start(sdlFlags);
    try {
        auto window = application->createWindow(width, height, windowFlags);
        return std::unique_ptr<Graphics>(new Graphics(application, window));
    } catch (const std::exception&) {
        application->quit();
        throw;
    }
}

sdlmodel::scenes::Graphics::~Graphics() {
    close();
}

void sdlmodel::scenes::Graphics::close() {
    if (auto application = std::exchange(application_, nullptr))
        application->quit();
    window_ = nullptr;
}
