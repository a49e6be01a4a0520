#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace sdlmodel {

    // A list whose readers iterate an immutable snapshot while writers swap in a modified copy.
    // Writers retry when another writer swapped first.
    template <typename T>
    class CopyOnWriteList {
        using Items = std::vector<T>;
        std::atomic<std::shared_ptr<const Items>> items{std::make_shared<const Items>()};

        void update(const std::function<void(Items&)>& modify) {
            auto current = items.load();
            while (true) {
                auto next = std::make_shared<Items>(*current);
                modify(*next);
                std::shared_ptr<const Items> replacement = std::move(next);
                if (items.compare_exchange_weak(current, replacement))
                    return;
            }
        }

    public:
        std::shared_ptr<const Items> snapshot() const { return items.load(); }

        size_t size() const { return snapshot()->size(); }
        bool empty() const { return snapshot()->empty(); }

        void add(T item) {
            update([&item](Items& list) { list.push_back(item); });
        }

        // Removes every element matching the predicate. Returns the number of removed elements.
        size_t removeIf(const std::function<bool(const T&)>& predicate) {
            size_t removed{0};
            update([&](Items& list) {
                auto before = list.size();
                std::erase_if(list, predicate);
                removed = before - list.size();
            });
            return removed;
        }

        void clear() {
            items.store(std::make_shared<const Items>());
        }
    };

}
