#include <sdlmodel/sdlmodel.hpp>

std::shared_ptr<sdlmodel::Properties> sdlmodel::Properties::create() {
    auto id = SDL_CreateProperties();
    if (id == 0) {
        Logger::global()->logError("Failed to create properties: %s", SDL_GetError());
        throw std::runtime_error(std::format("Failed to create properties: {}", SDL_GetError()));
    }
    std::shared_ptr<Properties> ret{new Properties()};
    ret->owned.adopt(id);
    ret->id_ = id;
    return ret;
}

sdlmodel::Properties::Properties(SDL_PropertiesID borrowed) : id_(borrowed) {
}

void sdlmodel::Properties::dispose() {
    owned.reset();
    id_ = 0;
}

SDL_PropertyType sdlmodel::Properties::propertyType(const char* name) const {
    if (disposed())
        return SDL_PROPERTY_TYPE_INVALID;
    return SDL_GetPropertyType(id_, name);
}

bool sdlmodel::Properties::has(const char* name) const {
    return !disposed() && SDL_HasProperty(id_, name);
}

sdlmodel::PropertyValue sdlmodel::Properties::value(const char* name) const {
    switch (propertyType(name)) {
        case SDL_PROPERTY_TYPE_STRING: return getString(name);
        case SDL_PROPERTY_TYPE_NUMBER: return getNumber(name);
        case SDL_PROPERTY_TYPE_FLOAT: return getFloat(name);
        case SDL_PROPERTY_TYPE_BOOLEAN: return getBoolean(name);
        case SDL_PROPERTY_TYPE_POINTER: return getPointer(name);
        default: return std::monostate{};
    }
}

std::string sdlmodel::Properties::getString(const char* name, const std::string& defaultValue) const {
    if (propertyType(name) != SDL_PROPERTY_TYPE_STRING)
        return defaultValue;
    auto s = SDL_GetStringProperty(id_, name, nullptr);
    return s ? std::string{s} : defaultValue;
}

int64_t sdlmodel::Properties::getNumber(const char* name, int64_t defaultValue) const {
    if (propertyType(name) != SDL_PROPERTY_TYPE_NUMBER)
        return defaultValue;
    return SDL_GetNumberProperty(id_, name, defaultValue);
}

float sdlmodel::Properties::getFloat(const char* name, float defaultValue) const {
    if (propertyType(name) != SDL_PROPERTY_TYPE_FLOAT)
        return defaultValue;
    return SDL_GetFloatProperty(id_, name, defaultValue);
}

bool sdlmodel::Properties::getBoolean(const char* name, bool defaultValue) const {
    if (propertyType(name) != SDL_PROPERTY_TYPE_BOOLEAN)
        return defaultValue;
    return SDL_GetBooleanProperty(id_, name, defaultValue);
}

void* sdlmodel::Properties::getPointer(const char* name) const {
    if (propertyType(name) != SDL_PROPERTY_TYPE_POINTER)
        return nullptr;
    return SDL_GetPointerProperty(id_, name, nullptr);
}

bool sdlmodel::Properties::setString(const char* name, const std::string& value) {
    return !disposed() && SDL_SetStringProperty(id_, name, value.c_str());
}

bool sdlmodel::Properties::setNumber(const char* name, int64_t value) {
    return !disposed() && SDL_SetNumberProperty(id_, name, value);
}

bool sdlmodel::Properties::setFloat(const char* name, float value) {
    return !disposed() && SDL_SetFloatProperty(id_, name, value);
}

bool sdlmodel::Properties::setBoolean(const char* name, bool value) {
    return !disposed() && SDL_SetBooleanProperty(id_, name, value);
}
