#pragma once

#include <optional>
#include <string>
#include <vector>

#include <sdlmodel-scenes/sdlmodel-scenes.hpp>

namespace scenes_test {

    // Records what is drawn, so that props can be tested without a renderer.
    class RecordingTarget : public sdlmodel::RenderTarget {
    public:
        std::optional<SDL_Rect> clip{};
        SDL_Color color{0, 0, 0, 255};
        std::vector<std::optional<SDL_Rect>> clipHistory{};
        std::vector<std::string> calls{};
        std::vector<SDL_FRect> destinations{};
        std::vector<double> angles{};

        std::optional<SDL_Rect> clipRect() const override { return clip; }
        void clipRect(std::optional<SDL_Rect> rect) override {
            clip = rect;
            clipHistory.push_back(rect);
        }
        SDL_Color drawColor() const override { return color; }
        void drawColor(SDL_Color value) override { color = value; }

        bool fillRect(const SDL_FRect& rect) override {
            calls.emplace_back("fillRect");
            destinations.push_back(rect);
            return true;
        }
        bool renderSurface(sdlmodel::Surface&, const SDL_FRect&, const SDL_FRect& destination) override {
            calls.emplace_back("renderSurface");
            destinations.push_back(destination);
            return true;
        }
        bool renderSurfaceRotated(sdlmodel::Surface&, const SDL_FRect&, const SDL_FRect& destination,
                                  double angle, SDL_FPoint, SDL_FlipMode) override {
            calls.emplace_back("renderSurfaceRotated");
            destinations.push_back(destination);
            angles.push_back(angle);
            return true;
        }
        bool renderDebugText(float, float, const std::string& text, float) override {
            calls.emplace_back("text:" + text);
            return true;
        }
    };

    // Counts updates and renders, and reports a fixed change result.
    class CountingProp : public sdlmodel::scenes::Prop {
    public:
        explicit CountingProp(bool changes = false, std::string name = {}) : changes(changes), name(std::move(name)) {}

        bool changes;
        std::string name;
        int updates{0};
        int renders{0};
        std::vector<SDL_Rect> updateBounds{};
        std::function<void()> onUpdate{};

        bool update(const sdlmodel::scenes::UpdateContext& context) override {
            updates++;
            updateBounds.push_back(context.bounds);
            if (onUpdate)
                onUpdate();
            return changes;
        }
        void render(sdlmodel::RenderTarget& target) override {
            renders++;
            if (!name.empty())
                target.renderDebugText(0, 0, name);
        }
    };

}
