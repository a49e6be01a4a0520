#pragma once

#include <memory>
#include "copy-on-write.hpp"

namespace sdlmodel {

    // Anything that holds a native resource released by `dispose()`.
    // Objects stay usable after disposal; their operations become no-ops returning defaults.
    class Disposable {
    public:
        virtual ~Disposable() = default;
        virtual void dispose() = 0;
        virtual bool disposed() const = 0;
    };

    // Weak registry of resources that an owner disposes when it goes away.
    class ResourceTracker {
        CopyOnWriteList<std::weak_ptr<Disposable>> resources{};

    public:
        void track(std::weak_ptr<Disposable> resource) {
            resources.removeIf([](const std::weak_ptr<Disposable>& r) { return r.expired(); });
            resources.add(std::move(resource));
        }

        size_t liveCount() const {
            size_t count{0};
            for (auto& r : *resources.snapshot())
                if (auto locked = r.lock(); locked && !locked->disposed())
                    count++;
            return count;
        }

        void disposeAll() {
            auto list = resources.snapshot();
            resources.clear();
            for (auto& r : *list)
                if (auto locked = r.lock())
                    locked->dispose();
        }
    };

}
