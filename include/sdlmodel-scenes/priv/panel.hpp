#pragma once

#include <memory>
#include <vector>
#include "prop.hpp"

namespace sdlmodel::scenes {

    enum class Measure {
        Pixels,
        Proportion
    };

    enum class Orientation {
        Vertical,
        Horizontal
    };

    // A prop placed in a StackPanel, with its size along each axis.
    class Panel {
        std::shared_ptr<Prop> prop_;
        SDL_Rect bounds_{0, 0, 0, 0};

    public:
        explicit Panel(std::shared_ptr<Prop> prop) : prop_(std::move(prop)) {}

        Measure widthMeasure{Measure::Proportion};
        Measure heightMeasure{Measure::Pixels};
        float width{100.0f};
        float height{100.0f};

        const std::shared_ptr<Prop>& prop() const { return prop_; }
        // Assigned by the layout pass.
        const SDL_Rect& bounds() const { return bounds_; }
        void bounds(const SDL_Rect& value) { bounds_ = value; }
    };

    // Distributes `bounds` among the panels along the orientation axis: pixel sizes first, then the
    // remaining extent (never negative) split by proportion. The cross axis takes the whole extent.
    void layoutStack(const std::vector<std::shared_ptr<Panel>>& panels, const SDL_Rect& bounds, Orientation orientation);

    class StackPanel : public Prop {
        CopyOnWriteList<std::shared_ptr<Panel>> panels_{};
        Orientation orientation_;

    public:
        explicit StackPanel(const std::vector<std::shared_ptr<Panel>>& panels = {}, Orientation orientation = Orientation::Vertical);

        Orientation orientation() const { return orientation_; }
        void orientation(Orientation value) { orientation_ = value; }
        bool vertical() const { return orientation_ == Orientation::Vertical; }

        void add(std::shared_ptr<Panel> panel);
        bool remove(const std::shared_ptr<Panel>& panel);
        std::vector<std::shared_ptr<Panel>> panels() const;

        // Lays out the panels within `context.bounds`, then updates each prop with its panel bounds.
        bool update(const UpdateContext& context) override;
        // Renders each panel clipped to its bounds, then restores the previous clip rectangle.
        void render(RenderTarget& target) override;
    };

    // Layers drawn on top of each other, all within the same bounds.
    class OverlayPanel : public Prop {
        CopyOnWriteList<std::shared_ptr<Prop>> layers_{};

    public:
        explicit OverlayPanel(const std::vector<std::shared_ptr<Prop>>& layers = {});

        void addLayer(std::shared_ptr<Prop> layer);
        bool removeLayer(const std::shared_ptr<Prop>& layer);
        std::vector<std::shared_ptr<Prop>> layers() const;

        bool update(const UpdateContext& context) override;
        void render(RenderTarget& target) override;
    };

}
