#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <SDL3/SDL.h>
#include "events.hpp"
#include "properties.hpp"
#include "renderer.hpp"
#include "surface.hpp"

namespace sdlmodel {

    class Application;

    struct BorderSize {
        int top;
        int left;
        int bottom;
        int right;
    };

    // A top-level window with its renderer. Windows are created by `Application::createWindow()`
    // and owned by the application. Closing the window (close requested) disposes it; after that
    // every property reads as a default value and setters do nothing.
    class Window : public Disposable {
    public:
        using RenderingHandler = std::function<void(Window& window, Renderer& renderer)>;

    private:
        Application* application_;
        NativeHandle<SDL_Window*, SDL_DestroyWindow> window_{};
        SDL_WindowID id_{0};
        std::shared_ptr<Properties> createProperties_{};
        std::unique_ptr<Renderer> renderer_{};
        std::shared_ptr<Surface> icon_{};
        std::atomic<SDL_Color> backgroundColor_{SDL_Color{0, 0, 0, 255}};
        EventHandlers<Window> events_{};
        struct RenderingEntry {
            uint64_t id;
            RenderingHandler handler;
        };
        CopyOnWriteList<RenderingEntry> renderingHandlers_{};
        std::atomic<uint64_t> nextRenderingId_{1};
        enum RenderState { Idle, Scheduled };
        std::atomic<RenderState> renderState_{Idle};

        void render();

    public:
        // Throws std::runtime_error when SDL cannot create the window or its renderer.
        // Must run on the application thread; use `Application::createWindow()`.
        Window(Application* application, const std::string& title, int width, int height, SDL_WindowFlags flags);
        ~Window() override;

        SDL_Window* handle() const { return window_.get(); }
        SDL_WindowID id() const { return id_; }
        Application* application() const { return application_; }
        // nullptr once disposed.
        Renderer* renderer() const;

        void dispose() override;
        bool disposed() const override { return !window_.alive(); }

        EventHandlers<Window>& events() { return events_; }
        uint64_t addRenderingHandler(RenderingHandler handler);
        bool removeRenderingHandler(uint64_t id);

        // Runs the window's handlers, then `shared` handlers (if any), then the built-in reactions
        // (close requested disposes, layout changes invalidate).
        void dispatchEvent(const Event& e, const EventHandlers<Window>* shared = nullptr);

        // Schedules a render on the application loop unless one is already pending.
        void invalidate();

        Properties properties() const;
        std::string createTitle() const;
        int createWidth() const;
        int createHeight() const;

        SDL_Color backgroundColor() const { return backgroundColor_.load(); }
        void backgroundColor(SDL_Color value) { backgroundColor_.store(value); }
        std::shared_ptr<Surface> icon() const { return icon_; }
        void icon(std::shared_ptr<Surface> value);

        std::string title() const;
        void title(const std::string& value);
        SDL_Point size() const;
        void size(SDL_Point value);
        SDL_Point position() const;
        void position(SDL_Point value);
        SDL_Point minimumSize() const;
        void minimumSize(SDL_Point value);
        SDL_Point maximumSize() const;
        void maximumSize(SDL_Point value);
        // min and max aspect ratio.
        SDL_FPoint aspectRatio() const;
        void aspectRatio(SDL_FPoint value);
        bool bordered() const;
        void bordered(bool value);
        BorderSize borderSize() const;
        bool focusable() const;
        void focusable(bool value);
        bool fullScreen() const;
        void fullScreen(bool value);
        // nullopt means borderless desktop full screen.
        std::optional<SDL_DisplayMode> fullScreenMode() const;
        void fullScreenMode(std::optional<SDL_DisplayMode> value);
        float displayScale() const;
        float pixelDensity() const;
        SDL_PixelFormat pixelFormat() const;
        SDL_WindowFlags flags() const;
    };

    // Texture helpers for a window's renderer. All throw std::runtime_error on failure.
    std::shared_ptr<Texture> createTexture(Window& window, int width, int height,
                                           std::optional<SDL_PixelFormat> format = std::nullopt,
                                           SDL_TextureAccess access = SDL_TEXTUREACCESS_STREAMING);
    // A texture of the window's size.
    std::shared_ptr<Texture> createTexture(Window& window);
    std::shared_ptr<Texture> createTexture(Window& window, Surface& surface);

}
