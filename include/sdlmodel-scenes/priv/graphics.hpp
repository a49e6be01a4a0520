#pragma once

#include <memory>
#include <sdlmodel/sdlmodel.hpp>

namespace sdlmodel::scenes {

    // Starts an application on its own thread with one window.
    class Graphics {
        Application* application_;
        Window* window_;

        Graphics(Application* application, Window* window) : application_(application), window_(window) {}

    public:
        ~Graphics();

        // Throws std::runtime_error when SDL, the window or its renderer cannot be initialized.
        static std::unique_ptr<Graphics> init(int width, int height,
                                              SDL_WindowFlags windowFlags = SDL_WINDOW_RESIZABLE,
                                              SDL_InitFlags sdlFlags = SDL_INIT_VIDEO);

        Application* application() const { return application_; }
        Window* window() const { return window_; }

        // Quits the application and waits for its thread. Does nothing the second time.
        void close();
    };

}
