#include "Configuration/GameConfiguration.hpp"
#include "RocketGame.hpp"
#include <sdlmodel/sdlmodel.hpp>
#include <sdlmodel-image/sdlmodel-image.hpp>
#include <sdlmodel-scenes/sdlmodel-scenes.hpp>
#include <cpptrace/from_current.hpp>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

static std::shared_ptr<sdlmodel::Surface> loadTransparentImage(const std::string& path, bool transparentFromCorner) {
    auto image = sdlmodel::loadImage(path);
    if (transparentFromCorner)
        sdlmodel::setAlpha(*image, 0, image->getPixel(0, 0));
    return image;
}

int runMain(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    std::vector<std::string> positional;
    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: grape [config.json]" << std::endl;
            return EXIT_SUCCESS;
        }
        positional.push_back(arg);
    }

    grape::GameConfiguration config{};
    if (!positional.empty())
        config = grape::GameConfiguration::load(positional[0]);
    else if (std::filesystem::exists("grape.json"))
        config = grape::GameConfiguration::load("grape.json");

    auto graphics = sdlmodel::scenes::Graphics::init(config.window.width, config.window.height,
                                                     SDL_WINDOW_RESIZABLE, SDL_INIT_VIDEO);
    auto application = graphics->application();
    auto window = graphics->window();

    std::shared_ptr<grape::RocketGame> game{};
    std::atomic<SDL_Point> windowSize{SDL_Point{config.window.width, config.window.height}};

    // SDL video calls stay on the application thread.
    application->send([&] {
        window->title(config.window.title);
        window->backgroundColor(config.window.background);
        window->fullScreen(config.window.fullScreen);

        try {
            window->icon(loadTransparentImage(config.rocket.icon, config.rocket.transparentFromCorner));
        } catch (const std::exception& e) {
            sdlmodel::Logger::global()->logWarning("Window icon is not set: %s", e.what());
        }

        auto size = window->size();
        windowSize.store(size);
        sdlmodel::scenes::Sprite rocket{loadTransparentImage(config.rocket.image, config.rocket.transparentFromCorner),
                                        size.x / 2.0f, size.y / 2.0f, config.rocket.scale};
        rocket.spin(config.rocket.spin);
        rocket.speed(config.rocket.speed);
        rocket.heading(config.rocket.heading);
        game = std::make_shared<grape::RocketGame>(std::move(rocket));
    });

    window->events().on<sdlmodel::KeyboardEvent>(sdlmodel::EventKind::KeyDown,
        [game](sdlmodel::Window& w, const sdlmodel::KeyboardEvent& e) {
            if (game->handleKey(e.key))
                w.invalidate();
        });
    window->events().on<sdlmodel::WindowEvent>(sdlmodel::EventKind::WindowResized,
        [&windowSize](sdlmodel::Window&, const sdlmodel::WindowEvent& e) {
            windowSize.store(SDL_Point{e.data1, e.data2});
        });

    bool debugOverlay = config.debugOverlay;
    window->addRenderingHandler([game, debugOverlay](sdlmodel::Window&, sdlmodel::Renderer& renderer) {
        game->render(renderer);
        if (debugOverlay) {
            renderer.drawColor(SDL_Color{255, 255, 255, 255});
            renderer.renderDebugText(0, 10, game->statusText(), 4);
        }
    });

    sdlmodel::PeriodicTimer timer{std::chrono::milliseconds(config.updatePeriodMs)};
    while (!window->disposed() && application->running()) {
        timer.waitForNextPeriod();
        auto size = windowSize.load();
        if (game->step(timer.elapsed(), SDL_Rect{0, 0, size.x, size.y}))
            window->invalidate();
    }

    graphics->close();
    std::cout << "Done" << std::endl;
    return EXIT_SUCCESS;
}

int main(int argc, char** argv) {
    CPPTRACE_TRY {
        return runMain(argc, argv);
    } CPPTRACE_CATCH(const std::exception& e) {
        std::cerr << "Exception in grape: " << e.what() << std::endl;
        cpptrace::from_current_exception().print();
        return EXIT_FAILURE;
    }
}
