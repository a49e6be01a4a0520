#include <sdlmodel/sdlmodel.hpp>

namespace sdlmodel {

    static std::optional<EventKind> appEventKind(uint32_t type) {
        switch (type) {
            case SDL_EVENT_QUIT: return EventKind::Quit;
            case SDL_EVENT_TERMINATING: return EventKind::Terminating;
            case SDL_EVENT_LOW_MEMORY: return EventKind::LowMemory;
            case SDL_EVENT_WILL_ENTER_BACKGROUND: return EventKind::WillEnterBackground;
            case SDL_EVENT_DID_ENTER_BACKGROUND: return EventKind::DidEnterBackground;
            case SDL_EVENT_WILL_ENTER_FOREGROUND: return EventKind::WillEnterForeground;
            case SDL_EVENT_DID_ENTER_FOREGROUND: return EventKind::DidEnterForeground;
            case SDL_EVENT_LOCALE_CHANGED: return EventKind::LocaleChanged;
            default: return std::nullopt;
        }
    }

    static std::optional<EventKind> windowEventKind(uint32_t type) {
        switch (type) {
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED: return EventKind::WindowCloseRequested;
            case SDL_EVENT_WINDOW_DESTROYED: return EventKind::WindowDestroyed;
            case SDL_EVENT_WINDOW_DISPLAY_CHANGED: return EventKind::WindowDisplayChanged;
            case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED: return EventKind::WindowDisplayScaleChanged;
            case SDL_EVENT_WINDOW_ENTER_FULLSCREEN: return EventKind::WindowEnterFullScreen;
            case SDL_EVENT_WINDOW_LEAVE_FULLSCREEN: return EventKind::WindowLeaveFullScreen;
            case SDL_EVENT_WINDOW_FOCUS_GAINED: return EventKind::WindowFocusGained;
            case SDL_EVENT_WINDOW_FOCUS_LOST: return EventKind::WindowFocusLost;
            case SDL_EVENT_WINDOW_HIDDEN: return EventKind::WindowHidden;
            case SDL_EVENT_WINDOW_SHOWN: return EventKind::WindowShown;
            case SDL_EVENT_WINDOW_EXPOSED: return EventKind::WindowExposed;
            case SDL_EVENT_WINDOW_OCCLUDED: return EventKind::WindowOccluded;
            case SDL_EVENT_WINDOW_MAXIMIZED: return EventKind::WindowMaximized;
            case SDL_EVENT_WINDOW_MINIMIZED: return EventKind::WindowMinimized;
            case SDL_EVENT_WINDOW_RESIZED: return EventKind::WindowResized;
            case SDL_EVENT_WINDOW_RESTORED: return EventKind::WindowRestored;
            case SDL_EVENT_WINDOW_MOUSE_ENTER: return EventKind::WindowMouseEnter;
            case SDL_EVENT_WINDOW_MOUSE_LEAVE: return EventKind::WindowMouseLeave;
            case SDL_EVENT_WINDOW_MOVED: return EventKind::WindowMoved;
            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED: return EventKind::WindowPixelSizeChanged;
            case SDL_EVENT_WINDOW_SAFE_AREA_CHANGED: return EventKind::WindowSafeAreaChanged;
            case SDL_EVENT_WINDOW_HDR_STATE_CHANGED: return EventKind::WindowHdrStateChanged;
            case SDL_EVENT_WINDOW_HIT_TEST: return EventKind::WindowHitTest;
            case SDL_EVENT_WINDOW_ICCPROF_CHANGED: return EventKind::WindowIccProfileChanged;
            case SDL_EVENT_WINDOW_METAL_VIEW_RESIZED: return EventKind::WindowMetalViewResized;
            default: return std::nullopt;
        }
    }

    std::optional<Event> decodeEvent(const SDL_Event& e) {
        auto timestamp = e.common.timestamp;
        if (auto kind = appEventKind(e.type))
            return AppEvent{*kind, timestamp};
        if (auto kind = windowEventKind(e.type))
            return WindowEvent{*kind, timestamp, e.window.windowID, e.window.data1, e.window.data2};

        switch (e.type) {
            case SDL_EVENT_KEY_DOWN:
            case SDL_EVENT_KEY_UP:
                return KeyboardEvent{e.type == SDL_EVENT_KEY_DOWN ? EventKind::KeyDown : EventKind::KeyUp, timestamp,
                                     e.key.windowID, e.key.which, e.key.scancode, e.key.key, e.key.mod, e.key.raw,
                                     e.key.down, e.key.repeat};
            case SDL_EVENT_TEXT_EDITING:
                return TextEditingEvent{EventKind::TextEditing, timestamp, e.edit.windowID,
                                        e.edit.text ? e.edit.text : "", e.edit.start, e.edit.length};
            case SDL_EVENT_TEXT_INPUT:
                return TextInputEvent{EventKind::TextInput, timestamp, e.text.windowID, e.text.text ? e.text.text : ""};
            case SDL_EVENT_MOUSE_ADDED:
            case SDL_EVENT_MOUSE_REMOVED:
                return MouseDeviceEvent{e.type == SDL_EVENT_MOUSE_ADDED ? EventKind::MouseAdded : EventKind::MouseRemoved,
                                        timestamp, e.mdevice.which};
            case SDL_EVENT_MOUSE_MOTION:
                return MouseMotionEvent{EventKind::MouseMotion, timestamp, e.motion.windowID, e.motion.which,
                                        e.motion.state, e.motion.x, e.motion.y, e.motion.xrel, e.motion.yrel};
            case SDL_EVENT_MOUSE_BUTTON_DOWN:
            case SDL_EVENT_MOUSE_BUTTON_UP:
                return MouseButtonEvent{e.type == SDL_EVENT_MOUSE_BUTTON_DOWN ? EventKind::MouseButtonDown : EventKind::MouseButtonUp,
                                        timestamp, e.button.windowID, e.button.which, e.button.button, e.button.down,
                                        e.button.clicks, e.button.x, e.button.y};
            case SDL_EVENT_MOUSE_WHEEL:
                return MouseWheelEvent{EventKind::MouseWheel, timestamp, e.wheel.windowID, e.wheel.which,
                                       e.wheel.x, e.wheel.y, e.wheel.direction, e.wheel.mouse_x, e.wheel.mouse_y};
            default:
                return std::nullopt;
        }
    }

    EventKind eventKind(const Event& e) {
        return std::visit([](auto& typed) { return typed.kind; }, e);
    }

    std::optional<SDL_WindowID> eventWindowId(const Event& e) {
        return std::visit([](auto& typed) -> std::optional<SDL_WindowID> {
            if constexpr (requires { typed.windowId; })
                return typed.windowId;
            else
                return std::nullopt;
        }, e);
    }

    const char* eventKindName(EventKind kind) {
        switch (kind) {
            case EventKind::Quit: return "Quit";
            case EventKind::Terminating: return "Terminating";
            case EventKind::LowMemory: return "LowMemory";
            case EventKind::WillEnterBackground: return "WillEnterBackground";
            case EventKind::DidEnterBackground: return "DidEnterBackground";
            case EventKind::WillEnterForeground: return "WillEnterForeground";
            case EventKind::DidEnterForeground: return "DidEnterForeground";
            case EventKind::LocaleChanged: return "LocaleChanged";
            case EventKind::KeyDown: return "KeyDown";
            case EventKind::KeyUp: return "KeyUp";
            case EventKind::TextEditing: return "TextEditing";
            case EventKind::TextInput: return "TextInput";
            case EventKind::WindowCloseRequested: return "WindowCloseRequested";
            case EventKind::WindowDestroyed: return "WindowDestroyed";
            case EventKind::WindowDisplayChanged: return "WindowDisplayChanged";
            case EventKind::WindowDisplayScaleChanged: return "WindowDisplayScaleChanged";
            case EventKind::WindowEnterFullScreen: return "WindowEnterFullScreen";
            case EventKind::WindowLeaveFullScreen: return "WindowLeaveFullScreen";
            case EventKind::WindowFocusGained: return "WindowFocusGained";
            case EventKind::WindowFocusLost: return "WindowFocusLost";
            case EventKind::WindowHidden: return "WindowHidden";
            case EventKind::WindowShown: return "WindowShown";
            case EventKind::WindowExposed: return "WindowExposed";
            case EventKind::WindowOccluded: return "WindowOccluded";
            case EventKind::WindowMaximized: return "WindowMaximized";
            case EventKind::WindowMinimized: return "WindowMinimized";
            case EventKind::WindowResized: return "WindowResized";
            case EventKind::WindowRestored: return "WindowRestored";
            case EventKind::WindowMouseEnter: return "WindowMouseEnter";
            case EventKind::WindowMouseLeave: return "WindowMouseLeave";
            case EventKind::WindowMoved: return "WindowMoved";
            case EventKind::WindowPixelSizeChanged: return "WindowPixelSizeChanged";
            case EventKind::WindowSafeAreaChanged: return "WindowSafeAreaChanged";
            case EventKind::WindowHdrStateChanged: return "WindowHdrStateChanged";
            case EventKind::WindowHitTest: return "WindowHitTest";
            case EventKind::WindowIccProfileChanged: return "WindowIccProfileChanged";
            case EventKind::WindowMetalViewResized: return "WindowMetalViewResized";
            case EventKind::MouseAdded: return "MouseAdded";
            case EventKind::MouseRemoved: return "MouseRemoved";
            case EventKind::MouseMotion: return "MouseMotion";
            case EventKind::MouseButtonDown: return "MouseButtonDown";
            case EventKind::MouseButtonUp: return "MouseButtonUp";
            case EventKind::MouseWheel: return "MouseWheel";
        }
        return "";
    }

}
