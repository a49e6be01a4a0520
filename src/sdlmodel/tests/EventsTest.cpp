#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <sdlmodel/sdlmodel.hpp>

namespace {

struct Recorder {
    std::vector<std::string> calls{};
};

SDL_Event keyEvent(SDL_EventType type, SDL_WindowID windowId, SDL_Keycode key) {
    SDL_Event e{};
    e.type = type;
    e.key.windowID = windowId;
    e.key.key = key;
    e.key.down = type == SDL_EVENT_KEY_DOWN;
    return e;
}

}

TEST(EventsTest, DecodesKeyboardEvent) {
    auto decoded = sdlmodel::decodeEvent(keyEvent(SDL_EVENT_KEY_DOWN, 3, SDLK_LEFT));
    ASSERT_TRUE(decoded.has_value());
    auto key = std::get_if<sdlmodel::KeyboardEvent>(&*decoded);
    ASSERT_NE(key, nullptr);
    EXPECT_EQ(key->kind, sdlmodel::EventKind::KeyDown);
    EXPECT_EQ(key->key, SDLK_LEFT);
    EXPECT_TRUE(key->down);
    EXPECT_EQ(sdlmodel::eventWindowId(*decoded), std::optional<SDL_WindowID>{3});
}

TEST(EventsTest, DecodesWindowEvent) {
    SDL_Event e{};
    e.type = SDL_EVENT_WINDOW_RESIZED;
    e.window.windowID = 7;
    e.window.data1 = 640;
    e.window.data2 = 480;
    auto decoded = sdlmodel::decodeEvent(e);
    ASSERT_TRUE(decoded.has_value());
    auto window = std::get_if<sdlmodel::WindowEvent>(&*decoded);
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(window->kind, sdlmodel::EventKind::WindowResized);
    EXPECT_EQ(window->data1, 640);
    EXPECT_EQ(window->data2, 480);
    EXPECT_EQ(sdlmodel::eventWindowId(*decoded), std::optional<SDL_WindowID>{7});
}

TEST(EventsTest, DecodesMouseEvents) {
    SDL_Event e{};
    e.type = SDL_EVENT_MOUSE_BUTTON_UP;
    e.button.windowID = 2;
    e.button.button = SDL_BUTTON_LEFT;
    e.button.x = 10.5f;
    e.button.y = 20.5f;
    auto decoded = sdlmodel::decodeEvent(e);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(sdlmodel::eventKind(*decoded), sdlmodel::EventKind::MouseButtonUp);
    auto button = std::get<sdlmodel::MouseButtonEvent>(*decoded);
    EXPECT_EQ(button.button, SDL_BUTTON_LEFT);
    EXPECT_FLOAT_EQ(button.x, 10.5f);

    SDL_Event added{};
    added.type = SDL_EVENT_MOUSE_ADDED;
    added.mdevice.which = 5;
    auto device = sdlmodel::decodeEvent(added);
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(sdlmodel::eventKind(*device), sdlmodel::EventKind::MouseAdded);
    // device events are not routed to a window.
    EXPECT_FALSE(sdlmodel::eventWindowId(*device).has_value());
}

TEST(EventsTest, QuitIsAnApplicationEvent) {
    SDL_Event e{};
    e.type = SDL_EVENT_QUIT;
    auto decoded = sdlmodel::decodeEvent(e);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(sdlmodel::eventKind(*decoded), sdlmodel::EventKind::Quit);
    EXPECT_FALSE(sdlmodel::eventWindowId(*decoded).has_value());
}

TEST(EventsTest, UnmodeledEventIsNotDecoded) {
    SDL_Event e{};
    e.type = SDL_EVENT_JOYSTICK_AXIS_MOTION;
    EXPECT_FALSE(sdlmodel::decodeEvent(e).has_value());
}

TEST(EventsTest, KindNames) {
    EXPECT_STREQ(sdlmodel::eventKindName(sdlmodel::EventKind::KeyDown), "KeyDown");
    EXPECT_STREQ(sdlmodel::eventKindName(sdlmodel::EventKind::WindowCloseRequested), "WindowCloseRequested");
}

TEST(EventHandlersTest, DispatchInvokesOnlyHandlersOfThatKind) {
    sdlmodel::EventHandlers<Recorder> handlers{};
    Recorder recorder{};
    handlers.on<sdlmodel::KeyboardEvent>(sdlmodel::EventKind::KeyDown, [](Recorder& r, const sdlmodel::KeyboardEvent& e) {
        r.calls.emplace_back("down:" + std::to_string(e.key));
    });
    handlers.on<sdlmodel::KeyboardEvent>(sdlmodel::EventKind::KeyUp, [](Recorder& r, const sdlmodel::KeyboardEvent&) {
        r.calls.emplace_back("up");
    });

    auto down = sdlmodel::decodeEvent(keyEvent(SDL_EVENT_KEY_DOWN, 1, SDLK_A));
    ASSERT_TRUE(down.has_value());
    EXPECT_EQ(handlers.dispatch(recorder, *down), 1u);
    ASSERT_EQ(recorder.calls.size(), 1u);
    EXPECT_EQ(recorder.calls[0], "down:" + std::to_string(SDLK_A));
}

TEST(EventHandlersTest, OffRemovesHandler) {
    sdlmodel::EventHandlers<Recorder> handlers{};
    Recorder recorder{};
    auto id = handlers.add(sdlmodel::EventKind::KeyDown, [](Recorder& r, const sdlmodel::Event&) { r.calls.emplace_back("a"); });
    handlers.add(sdlmodel::EventKind::KeyDown, [](Recorder& r, const sdlmodel::Event&) { r.calls.emplace_back("b"); });
    EXPECT_EQ(handlers.size(), 2u);

    EXPECT_TRUE(handlers.off(id));
    EXPECT_FALSE(handlers.off(id));
    EXPECT_EQ(handlers.size(), 1u);

    auto down = sdlmodel::decodeEvent(keyEvent(SDL_EVENT_KEY_DOWN, 1, SDLK_A));
    handlers.dispatch(recorder, *down);
    ASSERT_EQ(recorder.calls.size(), 1u);
    EXPECT_EQ(recorder.calls[0], "b");
}

TEST(EventHandlersTest, HandlerMayUnregisterItselfWhileDispatching) {
    sdlmodel::EventHandlers<Recorder> handlers{};
    Recorder recorder{};
    sdlmodel::EventHandlers<Recorder>::HandlerId id{};
    id = handlers.add(sdlmodel::EventKind::KeyDown, [&](Recorder& r, const sdlmodel::Event&) {
        r.calls.emplace_back("once");
        handlers.off(id);
    });

    auto down = sdlmodel::decodeEvent(keyEvent(SDL_EVENT_KEY_DOWN, 1, SDLK_A));
    handlers.dispatch(recorder, *down);
    handlers.dispatch(recorder, *down);
    EXPECT_EQ(recorder.calls.size(), 1u);
}
