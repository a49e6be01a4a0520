#include "GameConfiguration.hpp"
#include <choc/text/choc_JSON.h>
#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sdlmodel/sdlmodel.hpp>

namespace grape {

    static Uint8 readColorComponent(const choc::value::ValueView& array, uint32_t index, Uint8 defaultValue) {
        if (index >= array.size())
            return defaultValue;
        auto v = array[index].getWithDefault<int64_t>(defaultValue);
        return static_cast<Uint8>(std::clamp<int64_t>(v, 0, 255));
    }

    static void readWindow(const choc::value::ValueView& obj, WindowConfiguration& window) {
        if (obj.hasObjectMember("title"))
            window.title = std::string{obj["title"].getWithDefault<std::string_view>(window.title)};
        if (obj.hasObjectMember("width"))
            window.width = obj["width"].getWithDefault<int32_t>(window.width);
        if (obj.hasObjectMember("height"))
            window.height = obj["height"].getWithDefault<int32_t>(window.height);
        if (obj.hasObjectMember("fullScreen"))
            window.fullScreen = obj["fullScreen"].getWithDefault<bool>(window.fullScreen);
        if (obj.hasObjectMember("background") && obj["background"].isArray()) {
            auto bg = obj["background"];
            window.background = SDL_Color{
                readColorComponent(bg, 0, window.background.r),
                readColorComponent(bg, 1, window.background.g),
                readColorComponent(bg, 2, window.background.b),
                readColorComponent(bg, 3, window.background.a)
            };
        }
    }

    static void readRocket(const choc::value::ValueView& obj, RocketConfiguration& rocket) {
        if (obj.hasObjectMember("image"))
            rocket.image = std::string{obj["image"].getWithDefault<std::string_view>(rocket.image)};
        if (obj.hasObjectMember("icon"))
            rocket.icon = std::string{obj["icon"].getWithDefault<std::string_view>(rocket.icon)};
        if (obj.hasObjectMember("scale"))
            rocket.scale = static_cast<float>(obj["scale"].getWithDefault<double>(rocket.scale));
        if (obj.hasObjectMember("spin"))
            rocket.spin = static_cast<float>(obj["spin"].getWithDefault<double>(rocket.spin));
        if (obj.hasObjectMember("speed"))
            rocket.speed = static_cast<float>(obj["speed"].getWithDefault<double>(rocket.speed));
        if (obj.hasObjectMember("heading"))
            rocket.heading = static_cast<float>(obj["heading"].getWithDefault<double>(rocket.heading));
        if (obj.hasObjectMember("transparentFromCorner"))
            rocket.transparentFromCorner = obj["transparentFromCorner"].getWithDefault<bool>(rocket.transparentFromCorner);
    }

    GameConfiguration GameConfiguration::parse(std::string_view json) {
        choc::value::Value root;
        try {
            root = choc::json::parse(json);
        } catch (const choc::json::ParseError& e) {
            sdlmodel::Logger::global()->logError("Invalid game configuration: %s (line %d, column %d)",
                e.what(), static_cast<int>(e.lineAndColumn.line), static_cast<int>(e.lineAndColumn.column));
            throw std::runtime_error(std::format("Invalid game configuration: {} (line {}, column {})",
                e.what(), e.lineAndColumn.line, e.lineAndColumn.column));
        }
        if (!root.isObject()) {
            sdlmodel::Logger::global()->logError("Game configuration must be a JSON object");
            throw std::runtime_error("Game configuration must be a JSON object");
        }

        GameConfiguration config{};
        if (root.hasObjectMember("window") && root["window"].isObject())
            readWindow(root["window"], config.window);
        if (root.hasObjectMember("rocket") && root["rocket"].isObject())
            readRocket(root["rocket"], config.rocket);
        if (root.hasObjectMember("updatePeriodMs"))
            config.updatePeriodMs = std::max(1, root["updatePeriodMs"].getWithDefault<int32_t>(config.updatePeriodMs));
        if (root.hasObjectMember("debugOverlay"))
            config.debugOverlay = root["debugOverlay"].getWithDefault<bool>(config.debugOverlay);
        return config;
    }

    GameConfiguration GameConfiguration::load(const std::filesystem::path& file) {
        std::ifstream ifs(file);
        if (!ifs) {
            sdlmodel::Logger::global()->logError("Failed to open game configuration %s", file.string().c_str());
            throw std::runtime_error(std::format("Failed to open game configuration {}", file.string()));
        }
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return parse(buffer.str());
    }

}
