#include <sdlmodel-scenes/sdlmodel-scenes.hpp>

sdlmodel::scenes::Container::Container(const std::vector<std::shared_ptr<Prop>>& props) {
    for (auto& prop : props)
        props_.add(prop);
}

void sdlmodel::scenes::Container::add(std::shared_ptr<Prop> prop) {
    props_.add(std::move(prop));
}

bool sdlmodel::scenes::Container::remove(const std::shared_ptr<Prop>& prop) {
    return props_.removeIf([&prop](const std::shared_ptr<Prop>& p) { return p == prop; }) > 0;
}

std::vector<std::shared_ptr<sdlmodel::scenes::Prop>> sdlmodel::scenes::Container::props() const {
    return *props_.snapshot();
}

bool sdlmodel::scenes::Container::update(const UpdateContext& context) {
    bool changed = false;
    for (auto& prop : *props_.snapshot())
        if (prop->update(context))
            changed = true;
    return changed;
}

void sdlmodel::scenes::Container::render(RenderTarget& target) {
    for (auto& prop : *props_.snapshot())
        prop->render(target);
}

bool sdlmodel::scenes::Scene::update(const UpdateContext& context) {
    return update(context, CancellationToken{});
}

bool sdlmodel::scenes::Scene::update(const UpdateContext& context, const CancellationToken& token) {
    bool changed = false;
    for (auto& prop : *props_.snapshot()) {
        if (token.cancelled())
            return false;
        if (prop->update(context))
            changed = true;
    }
    return changed;
}
