#include <sdlmodel/sdlmodel.hpp>

sdlmodel::Window::Window(Application* application, const std::string& title, int width, int height, SDL_WindowFlags flags) :
    application_(application) {
    createProperties_ = Properties::create();
    createProperties_->setString(SDL_PROP_WINDOW_CREATE_TITLE_STRING, title);
    createProperties_->setNumber(SDL_PROP_WINDOW_CREATE_WIDTH_NUMBER, width);
    createProperties_->setNumber(SDL_PROP_WINDOW_CREATE_HEIGHT_NUMBER, height);
    createProperties_->setNumber(SDL_PROP_WINDOW_CREATE_FLAGS_NUMBER, static_cast<int64_t>(flags));

    auto window = SDL_CreateWindowWithProperties(createProperties_->id());
    if (!window) {
        Logger::global()->logError("Cannot create window: %s", SDL_GetError());
        throw std::runtime_error(std::format("Cannot create window: {}", SDL_GetError()));
    }
    window_.adopt(window);
    id_ = SDL_GetWindowID(window);
    renderer_ = std::make_unique<Renderer>(this);
}

sdlmodel::Window::~Window() {
    dispose();
}

void sdlmodel::Window::dispose() {
    if (!window_.alive())
        return;
    if (renderer_)
        renderer_->dispose();
    window_.reset();
    icon_.reset();
    createProperties_->dispose();
}

sdlmodel::Renderer* sdlmodel::Window::renderer() const {
    return disposed() ? nullptr : renderer_.get();
}

uint64_t sdlmodel::Window::addRenderingHandler(RenderingHandler handler) {
    auto id = nextRenderingId_++;
    renderingHandlers_.add(RenderingEntry{id, std::move(handler)});
    return id;
}

bool sdlmodel::Window::removeRenderingHandler(uint64_t id) {
    return renderingHandlers_.removeIf([id](const RenderingEntry& e) { return e.id == id; }) > 0;
}

void sdlmodel::Window::dispatchEvent(const Event& e, const EventHandlers<Window>* shared) {
    events_.dispatch(*this, e);
    if (shared)
        shared->dispatch(*this, e);

    switch (eventKind(e)) {
        case EventKind::WindowCloseRequested:
            dispose();
            break;
        case EventKind::WindowDisplayChanged:
        case EventKind::WindowDisplayScaleChanged:
        case EventKind::WindowEnterFullScreen:
        case EventKind::WindowLeaveFullScreen:
        case EventKind::WindowShown:
        case EventKind::WindowExposed:
        case EventKind::WindowMaximized:
        case EventKind::WindowMinimized:
        case EventKind::WindowResized:
        case EventKind::WindowRestored:
        case EventKind::WindowPixelSizeChanged:
        case EventKind::WindowSafeAreaChanged:
        case EventKind::WindowHdrStateChanged:
        case EventKind::WindowMetalViewResized:
            invalidate();
            break;
        default:
            break;
    }
}

void sdlmodel::Window::invalidate() {
    if (disposed())
        return;
    auto expected = Idle;
    if (!renderState_.compare_exchange_strong(expected, Scheduled))
        return;
    auto posted = application_->post([this] {
        // an invalidate() from a rendering handler schedules the next frame.
        renderState_.store(Idle);
        render();
    });
    // the loop has stopped; the window is about to be disposed on its thread.
    if (!posted)
        renderState_.store(Idle);
}

void sdlmodel::Window::render() {
    auto r = renderer();
    if (!r)
        return;
    r->drawColor(backgroundColor());
    r->clear();
    for (auto& entry : *renderingHandlers_.snapshot())
        entry.handler(*this, *r);
    r->present();
}

// Properties -----------------------------------------------------------------

sdlmodel::Properties sdlmodel::Window::properties() const {
    return Properties{disposed() ? 0 : SDL_GetWindowProperties(window_.get())};
}

std::string sdlmodel::Window::createTitle() const {
    return createProperties_->getString(SDL_PROP_WINDOW_CREATE_TITLE_STRING);
}

int sdlmodel::Window::createWidth() const {
    return static_cast<int>(createProperties_->getNumber(SDL_PROP_WINDOW_CREATE_WIDTH_NUMBER));
}

int sdlmodel::Window::createHeight() const {
    return static_cast<int>(createProperties_->getNumber(SDL_PROP_WINDOW_CREATE_HEIGHT_NUMBER));
}

void sdlmodel::Window::icon(std::shared_ptr<Surface> value) {
    if (disposed() || !value || value->disposed())
        return;
    icon_ = std::move(value);
    if (!SDL_SetWindowIcon(window_.get(), icon_->handle()))
        Logger::global()->logWarning("Cannot set window icon: %s", SDL_GetError());
}

std::string sdlmodel::Window::title() const {
    if (disposed())
        return "";
    auto s = SDL_GetWindowTitle(window_.get());
    return s ? s : "";
}

void sdlmodel::Window::title(const std::string& value) {
    if (!disposed())
        SDL_SetWindowTitle(window_.get(), value.c_str());
}

SDL_Point sdlmodel::Window::size() const {
    SDL_Point ret{0, 0};
    if (!disposed())
        SDL_GetWindowSize(window_.get(), &ret.x, &ret.y);
    return ret;
}

void sdlmodel::Window::size(SDL_Point value) {
    if (!disposed())
        SDL_SetWindowSize(window_.get(), value.x, value.y);
}

SDL_Point sdlmodel::Window::position() const {
    SDL_Point ret{0, 0};
    if (!disposed())
        SDL_GetWindowPosition(window_.get(), &ret.x, &ret.y);
    return ret;
}

void sdlmodel::Window::position(SDL_Point value) {
    if (!disposed())
        SDL_SetWindowPosition(window_.get(), value.x, value.y);
}

SDL_Point sdlmodel::Window::minimumSize() const {
    SDL_Point ret{0, 0};
    if (!disposed())
        SDL_GetWindowMinimumSize(window_.get(), &ret.x, &ret.y);
    return ret;
}

void sdlmodel::Window::minimumSize(SDL_Point value) {
    if (!disposed())
        SDL_SetWindowMinimumSize(window_.get(), value.x, value.y);
}

SDL_Point sdlmodel::Window::maximumSize() const {
    SDL_Point ret{0, 0};
    if (!disposed())
        SDL_GetWindowMaximumSize(window_.get(), &ret.x, &ret.y);
    return ret;
}

void sdlmodel::Window::maximumSize(SDL_Point value) {
    if (!disposed())
        SDL_SetWindowMaximumSize(window_.get(), value.x, value.y);
}

SDL_FPoint sdlmodel::Window::aspectRatio() const {
    SDL_FPoint ret{0, 0};
    if (!disposed())
        SDL_GetWindowAspectRatio(window_.get(), &ret.x, &ret.y);
    return ret;
}

void sdlmodel::Window::aspectRatio(SDL_FPoint value) {
    if (!disposed())
        SDL_SetWindowAspectRatio(window_.get(), value.x, value.y);
}

bool sdlmodel::Window::bordered() const {
    return !disposed() && (flags() & SDL_WINDOW_BORDERLESS) == 0;
}

void sdlmodel::Window::bordered(bool value) {
    if (!disposed())
        SDL_SetWindowBordered(window_.get(), value);
}

sdlmodel::BorderSize sdlmodel::Window::borderSize() const {
    BorderSize ret{0, 0, 0, 0};
    if (!disposed())
        SDL_GetWindowBordersSize(window_.get(), &ret.top, &ret.left, &ret.bottom, &ret.right);
    return ret;
}

bool sdlmodel::Window::focusable() const {
    return !disposed() && (flags() & SDL_WINDOW_NOT_FOCUSABLE) == 0;
}

void sdlmodel::Window::focusable(bool value) {
    if (!disposed())
        SDL_SetWindowFocusable(window_.get(), value);
}

bool sdlmodel::Window::fullScreen() const {
    return !disposed() && (flags() & SDL_WINDOW_FULLSCREEN) != 0;
}

void sdlmodel::Window::fullScreen(bool value) {
    if (!disposed())
        SDL_SetWindowFullscreen(window_.get(), value);
}

std::optional<SDL_DisplayMode> sdlmodel::Window::fullScreenMode() const {
    if (disposed())
        return std::nullopt;
    auto mode = SDL_GetWindowFullscreenMode(window_.get());
    if (!mode)
        return std::nullopt;
    return *mode;
}

void sdlmodel::Window::fullScreenMode(std::optional<SDL_DisplayMode> value) {
    if (!disposed())
        SDL_SetWindowFullscreenMode(window_.get(), value ? &*value : nullptr);
}

float sdlmodel::Window::displayScale() const {
    return disposed() ? 0 : SDL_GetWindowDisplayScale(window_.get());
}

float sdlmodel::Window::pixelDensity() const {
    return disposed() ? 0 : SDL_GetWindowPixelDensity(window_.get());
}

SDL_PixelFormat sdlmodel::Window::pixelFormat() const {
    return disposed() ? SDL_PIXELFORMAT_UNKNOWN : SDL_GetWindowPixelFormat(window_.get());
}

SDL_WindowFlags sdlmodel::Window::flags() const {
    return disposed() ? 0 : SDL_GetWindowFlags(window_.get());
}

// Texture helpers ------------------------------------------------------------

static sdlmodel::Renderer& rendererOf(sdlmodel::Window& window) {
    auto r = window.renderer();
    if (!r)
        throw std::runtime_error("Cannot create a texture for a disposed window");
    return *r;
}

std::shared_ptr<sdlmodel::Texture> sdlmodel::createTexture(Window& window, int width, int height,
                                                           std::optional<SDL_PixelFormat> format, SDL_TextureAccess access) {
    return rendererOf(window).createTexture(width, height, format.value_or(window.pixelFormat()), access);
}

std::shared_ptr<sdlmodel::Texture> sdlmodel::createTexture(Window& window) {
    auto size = window.size();
    return createTexture(window, size.x, size.y);
}

std::shared_ptr<sdlmodel::Texture> sdlmodel::createTexture(Window& window, Surface& surface) {
    return rendererOf(window).createTexture(surface);
}
