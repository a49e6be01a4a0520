#include <gtest/gtest.h>

#include "TestProps.hpp"

using namespace sdlmodel::scenes;
using scenes_test::CountingProp;

namespace {

UpdateContext context() {
    return UpdateContext{std::chrono::milliseconds{100}, SDL_Rect{0, 0, 320, 240}};
}

}

TEST(ContainerTest, UpdateReportsAnyChange) {
    auto still = std::make_shared<CountingProp>(false);
    auto moving = std::make_shared<CountingProp>(true);
    Container container{{still, moving}};
    EXPECT_TRUE(container.update(context()));
    // every child is updated even after one reported a change.
    EXPECT_EQ(still->updates, 1);
    EXPECT_EQ(moving->updates, 1);

    EXPECT_TRUE(container.remove(moving));
    EXPECT_FALSE(container.update(context()));
}

TEST(ContainerTest, OneChangedChildAmongThree) {
    auto first = std::make_shared<CountingProp>(false);
    auto changed = std::make_shared<CountingProp>(true);
    auto last = std::make_shared<CountingProp>(false);
    Container container{{first, changed, last}};
    EXPECT_TRUE(container.update(context()));

    scenes_test::RecordingTarget target{};
    container.render(target);
    for (auto& child : {first, changed, last}) {
        EXPECT_EQ(child->updates, 1);
        EXPECT_EQ(child->renders, 1);
    }
}

TEST(ContainerTest, RenderInInsertionOrder) {
    Container container{};
    container.add(std::make_shared<CountingProp>(false, "a"));
    container.add(std::make_shared<CountingProp>(false, "b"));
    scenes_test::RecordingTarget target{};
    container.render(target);
    EXPECT_EQ(target.calls, (std::vector<std::string>{"text:a", "text:b"}));
}

TEST(ContainerTest, ChildMayBeAddedDuringUpdate) {
    Container container{};
    auto first = std::make_shared<CountingProp>();
    auto late = std::make_shared<CountingProp>();
    first->onUpdate = [&] { container.add(late); };
    container.add(first);
    container.update(context());
    EXPECT_EQ(late->updates, 0);
    EXPECT_EQ(container.props().size(), 2u);
}

TEST(SceneTest, CancelledUpdateStopsBeforeNextChild) {
    sdlmodel::CancellationSource source{};
    auto first = std::make_shared<CountingProp>(true);
    auto second = std::make_shared<CountingProp>(true);
    first->onUpdate = [&] { source.cancel(); };
    Scene scene{{first, second}};

    EXPECT_FALSE(scene.update(context(), source.token()));
    EXPECT_EQ(first->updates, 1);
    EXPECT_EQ(second->updates, 0);
}

TEST(SceneTest, UpdateWithoutTokenUpdatesAll) {
    auto first = std::make_shared<CountingProp>(false);
    auto second = std::make_shared<CountingProp>(true);
    Scene scene{{first, second}};
    EXPECT_TRUE(scene.update(context()));
    EXPECT_EQ(second->updates, 1);
}

TEST(OverlayPanelTest, FansOutOncePerLayer) {
    auto bottom = std::make_shared<CountingProp>(false, "bottom");
    auto top = std::make_shared<CountingProp>(true, "top");
    OverlayPanel overlay{{bottom, top}};

    EXPECT_TRUE(overlay.update(context()));
    EXPECT_EQ(bottom->updates, 1);
    EXPECT_EQ(top->updates, 1);
    EXPECT_EQ(top->updateBounds[0].w, 320);

    scenes_test::RecordingTarget target{};
    overlay.render(target);
    EXPECT_EQ(target.calls, (std::vector<std::string>{"text:bottom", "text:top"}));
    EXPECT_EQ(bottom->renders, 1);
    EXPECT_EQ(top->renders, 1);
}

TEST(OverlayPanelTest, RemoveLayer) {
    auto layer = std::make_shared<CountingProp>();
    OverlayPanel overlay{};
    overlay.addLayer(layer);
    EXPECT_EQ(overlay.layers().size(), 1u);
    EXPECT_TRUE(overlay.removeLayer(layer));
    EXPECT_FALSE(overlay.update(context()));
    EXPECT_EQ(layer->updates, 0);
}
