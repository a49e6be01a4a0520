#include <sdlmodel/sdlmodel.hpp>

std::string sdlmodel::Display::name() const {
    auto s = SDL_GetDisplayName(id_);
    return s ? s : "";
}

SDL_Rect sdlmodel::Display::bounds() const {
    SDL_Rect ret{};
    if (!SDL_GetDisplayBounds(id_, &ret))
        return SDL_Rect{0, 0, 0, 0};
    return ret;
}

SDL_Rect sdlmodel::Display::usableBounds() const {
    SDL_Rect ret{};
    if (!SDL_GetDisplayUsableBounds(id_, &ret))
        return SDL_Rect{0, 0, 0, 0};
    return ret;
}

float sdlmodel::Display::contentScale() const {
    return SDL_GetDisplayContentScale(id_);
}

SDL_DisplayMode sdlmodel::Display::displayMode() const {
    auto mode = SDL_GetCurrentDisplayMode(id_);
    return mode ? *mode : SDL_DisplayMode{};
}

SDL_DisplayMode sdlmodel::Display::desktopDisplayMode() const {
    auto mode = SDL_GetDesktopDisplayMode(id_);
    return mode ? *mode : SDL_DisplayMode{};
}

std::vector<SDL_DisplayMode> sdlmodel::Display::fullScreenDisplayModes() const {
    std::vector<SDL_DisplayMode> ret{};
    int count{0};
    auto modes = SDL_GetFullscreenDisplayModes(id_, &count);
    if (!modes)
        return ret;
    for (int i = 0; i < count; i++)
        ret.emplace_back(*modes[i]);
    SDL_free(modes);
    return ret;
}

SDL_DisplayOrientation sdlmodel::Display::naturalOrientation() const {
    return SDL_GetNaturalDisplayOrientation(id_);
}

SDL_DisplayOrientation sdlmodel::Display::orientation() const {
    return SDL_GetCurrentDisplayOrientation(id_);
}

SDL_DisplayMode sdlmodel::Display::closestFullScreenDisplayMode(int width, int height, float refreshRate, bool includeHighDensityModes) const {
    SDL_DisplayMode ret{};
    if (SDL_GetClosestFullscreenDisplayMode(id_, width, height, refreshRate, includeHighDensityModes, &ret))
        return ret;
    return desktopDisplayMode();
}

std::vector<sdlmodel::Display> sdlmodel::Display::displays() {
    std::vector<Display> ret{};
    int count{0};
    auto ids = SDL_GetDisplays(&count);
    if (!ids)
        return ret;
    for (int i = 0; i < count; i++)
        ret.emplace_back(ids[i]);
    SDL_free(ids);
    return ret;
}

static std::optional<sdlmodel::Display> findDisplay(SDL_DisplayID id) {
    if (id == 0)
        return std::nullopt;
    for (auto& d : sdlmodel::Display::displays())
        if (d.id() == id)
            return d;
    return std::nullopt;
}

sdlmodel::Display sdlmodel::Display::primaryDisplay() {
    auto display = findDisplay(SDL_GetPrimaryDisplay());
    if (!display) {
        Logger::global()->logError("No primary display found: %s", SDL_GetError());
        throw std::runtime_error("No primary display found.");
    }
    return *display;
}

std::optional<sdlmodel::Display> sdlmodel::Display::displayForPoint(SDL_Point point) {
    return findDisplay(SDL_GetDisplayForPoint(&point));
}

std::optional<sdlmodel::Display> sdlmodel::Display::displayForRect(SDL_Rect rect) {
    return findDisplay(SDL_GetDisplayForRect(&rect));
}
