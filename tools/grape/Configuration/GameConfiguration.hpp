#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <SDL3/SDL_pixels.h>

namespace grape {

    struct WindowConfiguration {
        std::string title{"Grape"};
        int width{800};
        int height{600};
        bool fullScreen{false};
        SDL_Color background{0, 20, 0, 255};
    };

    struct RocketConfiguration {
        std::string image{"rocket.png"};
        std::string icon{"grape.bmp"};
        float scale{0.2f};
        // degrees per second
        float spin{0};
        // units per second
        float speed{0};
        // degrees, 0 is up
        float heading{0};
        // treat the colour of pixel (0,0) as transparent
        bool transparentFromCorner{true};
    };

    class GameConfiguration {
    public:
        WindowConfiguration window{};
        RocketConfiguration rocket{};
        int updatePeriodMs{4};
        bool debugOverlay{true};

        // Members missing from the JSON keep their defaults.
        // Throws std::runtime_error if the text is not a JSON object or cannot be parsed.
        static GameConfiguration parse(std::string_view json);
        // Throws std::runtime_error if the file cannot be read, or as parse() does.
        static GameConfiguration load(const std::filesystem::path& file);
    };

}
