#pragma once

#include <memory>
#include <vector>
#include "prop.hpp"

namespace sdlmodel::scenes {

    // Ordered children updated and rendered in insertion order.
    // Children can be added or removed from any thread; a pass works on a snapshot.
    class Container : public Prop {
    protected:
        CopyOnWriteList<std::shared_ptr<Prop>> props_{};

    public:
        Container() = default;
        explicit Container(const std::vector<std::shared_ptr<Prop>>& props);

        void add(std::shared_ptr<Prop> prop);
        bool remove(const std::shared_ptr<Prop>& prop);
        std::vector<std::shared_ptr<Prop>> props() const;

        // Updates every child; true if any of them changed.
        bool update(const UpdateContext& context) override;
        void render(RenderTarget& target) override;
    };

    // The root of a scene graph.
    class Scene : public Container {
    public:
        using Container::Container;

        bool update(const UpdateContext& context) override;
        // Checks `token` before each child and stops with `false` once it is cancelled.
        bool update(const UpdateContext& context, const CancellationToken& token);
    };

}
