#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sdlmodel-scenes/sdlmodel-scenes.hpp>

namespace {

    constexpr int64_t maxCoordinate = std::numeric_limits<int>::max();
    constexpr int64_t minCoordinate = std::numeric_limits<int>::min();

    // NaN and negative sizes are empty; anything beyond the int range saturates.
    int pixelSize(float value) {
        if (!(value > 0.0f))
            return 0;
        if (value >= static_cast<float>(maxCoordinate))
            return static_cast<int>(maxCoordinate);
        return static_cast<int>(value);
    }

    double weightOf(float value) {
        if (!(value > 0.0f))
            return 0;
        return std::isinf(value) ? std::numeric_limits<float>::max() : value;
    }

    int saturate(int64_t value) {
        return static_cast<int>(std::clamp(value, minCoordinate, maxCoordinate));
    }

}

void sdlmodel::scenes::layoutStack(const std::vector<std::shared_ptr<Panel>>& panels, const SDL_Rect& bounds, Orientation orientation) {
    bool vertical = orientation == Orientation::Vertical;
    auto measureOf = [vertical](const Panel& p) { return vertical ? p.heightMeasure : p.widthMeasure; };
    auto sizeOf = [vertical](const Panel& p) { return vertical ? p.height : p.width; };

    int64_t extent = vertical ? bounds.h : bounds.w;
    int64_t fixed = 0;
    double totalWeight = 0;
    for (auto& panel : panels) {
        if (measureOf(*panel) == Measure::Pixels)
            fixed += pixelSize(sizeOf(*panel));
        else
            totalWeight += weightOf(sizeOf(*panel));
    }
    int64_t remaining = std::max<int64_t>(0, extent - fixed);

    // proportional panels end at floor(remaining * cumulativeWeight / totalWeight), so that
    // their sizes add up to `remaining` exactly.
    double cumulativeWeight = 0;
    int64_t allocated = 0;
    int64_t offset = vertical ? bounds.y : bounds.x;
    for (auto& panel : panels) {
        int size;
        if (measureOf(*panel) == Measure::Pixels)
            size = pixelSize(sizeOf(*panel));
        else if (totalWeight <= 0)
            size = 0;
        else {
            cumulativeWeight += weightOf(sizeOf(*panel));
            auto end = std::min(remaining, static_cast<int64_t>(std::floor(remaining * std::min(1.0, cumulativeWeight / totalWeight))));
            size = static_cast<int>(std::max<int64_t>(0, end - allocated));
            allocated = std::max(allocated, end);
        }

        if (vertical)
            panel->bounds(SDL_Rect{bounds.x, saturate(offset), bounds.w, size});
        else
            panel->bounds(SDL_Rect{saturate(offset), bounds.y, size, bounds.h});
        offset += size;
    }
}

// StackPanel -----------------------------------------------------------------

sdlmodel::scenes::StackPanel::StackPanel(const std::vector<std::shared_ptr<Panel>>& panels, Orientation orientation) :
    orientation_(orientation) {
    for (auto& panel : panels)
        panels_.add(panel);
}

void sdlmodel::scenes::StackPanel::add(std::shared_ptr<Panel> panel) {
    panels_.add(std::move(panel));
}

bool sdlmodel::scenes::StackPanel::remove(const std::shared_ptr<Panel>& panel) {
    return panels_.removeIf([&panel](const std::shared_ptr<Panel>& p) { return p == panel; }) > 0;
}

std::vector<std::shared_ptr<sdlmodel::scenes::Panel>> sdlmodel::scenes::StackPanel::panels() const {
    return *panels_.snapshot();
}

bool sdlmodel::scenes::StackPanel::update(const UpdateContext& context) {
    auto panels = panels_.snapshot();
    layoutStack(*panels, context.bounds, orientation_);

    bool changed = false;
    for (auto& panel : *panels)
        if (panel->prop()->update(UpdateContext{context.time, panel->bounds()}))
            changed = true;
    return changed;
}

void sdlmodel::scenes::StackPanel::render(RenderTarget& target) {
    auto previousClip = target.clipRect();
    for (auto& panel : *panels_.snapshot()) {
        target.clipRect(panel->bounds());
        panel->prop()->render(target);
    }
    target.clipRect(previousClip);
}

// OverlayPanel ---------------------------------------------------------------

sdlmodel::scenes::OverlayPanel::OverlayPanel(const std::vector<std::shared_ptr<Prop>>& layers) {
    for (auto& layer : layers)
        layers_.add(layer);
}

void sdlmodel::scenes::OverlayPanel::addLayer(std::shared_ptr<Prop> layer) {
    layers_.add(std::move(layer));
}

bool sdlmodel::scenes::OverlayPanel::removeLayer(const std::shared_ptr<Prop>& layer) {
    return layers_.removeIf([&layer](const std::shared_ptr<Prop>& p) { return p == layer; }) > 0;
}

std::vector<std::shared_ptr<sdlmodel::scenes::Prop>> sdlmodel::scenes::OverlayPanel::layers() const {
    return *layers_.snapshot();
}

bool sdlmodel::scenes::OverlayPanel::update(const UpdateContext& context) {
    bool changed = false;
    for (auto& layer : *layers_.snapshot())
        if (layer->update(context))
            changed = true;
    return changed;
}

void sdlmodel::scenes::OverlayPanel::render(RenderTarget& target) {
    for (auto& layer : *layers_.snapshot())
        layer->render(target);
}
