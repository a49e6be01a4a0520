#pragma once

#include <span>
#include <string>
#include <variant>
#include <SDL3/SDL.h>
#include "disposable.hpp"
#include "native-handle.hpp"

namespace sdlmodel {

    using PropertyValue = std::variant<std::monostate, std::string, int64_t, float, bool, void*>;

    // An SDL property group. Groups made by `create()` are owned and destroyed on dispose;
    // groups obtained from other SDL objects are borrowed and left alone.
    class Properties : public Disposable {
        NativeHandle<SDL_PropertiesID, SDL_DestroyProperties> owned{};
        SDL_PropertiesID id_{0};

    public:
        // Throws std::runtime_error when SDL cannot allocate the group.
        static std::shared_ptr<Properties> create();
        // Wraps a group owned by something else.
        explicit Properties(SDL_PropertiesID borrowed);
        ~Properties() override = default;

        SDL_PropertiesID id() const { return id_; }
        bool owning() const { return owned.alive(); }

        void dispose() override;
        bool disposed() const override { return id_ == 0; }

        SDL_PropertyType propertyType(const char* name) const;
        bool has(const char* name) const;
        // Empty (monostate) when the property does not exist or the group is disposed.
        PropertyValue value(const char* name) const;

        std::string getString(const char* name, const std::string& defaultValue = {}) const;
        int64_t getNumber(const char* name, int64_t defaultValue = 0) const;
        float getFloat(const char* name, float defaultValue = 0) const;
        bool getBoolean(const char* name, bool defaultValue = false) const;
        void* getPointer(const char* name) const;

        bool setString(const char* name, const std::string& value);
        bool setNumber(const char* name, int64_t value);
        bool setFloat(const char* name, float value);
        bool setBoolean(const char* name, bool value);

        // Reads a pointer property designating an array that ends with a default-valued element.
        template <typename T>
        std::span<const T> pointerSpan(const char* name) const {
            auto head = static_cast<const T*>(getPointer(name));
            if (!head)
                return {};
            size_t count{0};
            while (head[count] != T{})
                count++;
            return {head, count};
        }

    private:
        Properties() = default;
    };

}
