#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <SDL3/SDL.h>
#include "copy-on-write.hpp"

namespace sdlmodel {

    enum class EventKind {
        // application
        Quit,
        Terminating,
        LowMemory,
        WillEnterBackground,
        DidEnterBackground,
        WillEnterForeground,
        DidEnterForeground,
        LocaleChanged,
        // keyboard
        KeyDown,
        KeyUp,
        TextEditing,
        TextInput,
        // window
        WindowCloseRequested,
        WindowDestroyed,
        WindowDisplayChanged,
        WindowDisplayScaleChanged,
        WindowEnterFullScreen,
        WindowLeaveFullScreen,
        WindowFocusGained,
        WindowFocusLost,
        WindowHidden,
        WindowShown,
        WindowExposed,
        WindowOccluded,
        WindowMaximized,
        WindowMinimized,
        WindowResized,
        WindowRestored,
        WindowMouseEnter,
        WindowMouseLeave,
        WindowMoved,
        WindowPixelSizeChanged,
        WindowSafeAreaChanged,
        WindowHdrStateChanged,
        WindowHitTest,
        WindowIccProfileChanged,
        WindowMetalViewResized,
        // mouse
        MouseAdded,
        MouseRemoved,
        MouseMotion,
        MouseButtonDown,
        MouseButtonUp,
        MouseWheel
    };

    const char* eventKindName(EventKind kind);

    struct AppEvent {
        EventKind kind;
        uint64_t timestamp;
    };

    struct KeyboardEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_WindowID windowId;
        SDL_KeyboardID which;
        SDL_Scancode scancode;
        SDL_Keycode key;
        SDL_Keymod mod;
        uint16_t raw;
        bool down;
        bool repeat;
    };

    struct TextEditingEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_WindowID windowId;
        std::string text;
        int32_t start;
        int32_t length;
    };

    struct TextInputEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_WindowID windowId;
        std::string text;
    };

    struct WindowEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_WindowID windowId;
        int32_t data1;
        int32_t data2;
    };

    struct MouseDeviceEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_MouseID which;
    };

    struct MouseMotionEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_WindowID windowId;
        SDL_MouseID which;
        SDL_MouseButtonFlags state;
        float x;
        float y;
        float xrel;
        float yrel;
    };

    struct MouseButtonEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_WindowID windowId;
        SDL_MouseID which;
        uint8_t button;
        bool down;
        uint8_t clicks;
        float x;
        float y;
    };

    struct MouseWheelEvent {
        EventKind kind;
        uint64_t timestamp;
        SDL_WindowID windowId;
        SDL_MouseID which;
        float x;
        float y;
        SDL_MouseWheelDirection direction;
        float mouseX;
        float mouseY;
    };

    using Event = std::variant<AppEvent, KeyboardEvent, TextEditingEvent, TextInputEvent, WindowEvent,
                               MouseDeviceEvent, MouseMotionEvent, MouseButtonEvent, MouseWheelEvent>;

    // Decodes the SDL event union. Returns nullopt for event types that are not modeled.
    std::optional<Event> decodeEvent(const SDL_Event& e);

    EventKind eventKind(const Event& e);
    // The window an event is routed to, if any.
    std::optional<SDL_WindowID> eventWindowId(const Event& e);

    // Handlers keyed by event kind. Dispatch reads a snapshot, so handlers may register or
    // unregister handlers while being dispatched.
    template <typename Sender>
    class EventHandlers {
    public:
        using Handler = std::function<void(Sender& sender, const Event& e)>;
        using HandlerId = uint64_t;

    private:
        struct Entry {
            HandlerId id;
            EventKind kind;
            Handler handler;
        };
        CopyOnWriteList<Entry> entries{};
        std::atomic<HandlerId> nextId{1};

    public:
        HandlerId add(EventKind kind, Handler handler) {
            auto id = nextId++;
            entries.add(Entry{id, kind, std::move(handler)});
            return id;
        }

        // Registers a handler that receives the event as its concrete type.
        template <typename T>
        HandlerId on(EventKind kind, std::function<void(Sender& sender, const T& e)> handler) {
            return add(kind, [handler = std::move(handler)](Sender& sender, const Event& e) {
                if (auto typed = std::get_if<T>(&e))
                    handler(sender, *typed);
            });
        }

        bool off(HandlerId id) {
            return entries.removeIf([id](const Entry& entry) { return entry.id == id; }) > 0;
        }

        // Returns the number of handlers invoked.
        size_t dispatch(Sender& sender, const Event& e) const {
            auto kind = eventKind(e);
            size_t count{0};
            for (auto& entry : *entries.snapshot()) {
                if (entry.kind != kind)
                    continue;
                entry.handler(sender, e);
                count++;
            }
            return count;
        }

        size_t size() const { return entries.size(); }
    };

}
