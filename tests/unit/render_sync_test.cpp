#include <gtest/gtest.h>
#include "rrect/systems/render_sync.hpp"
#include "rrect/components/basic.hpp"
#include "rrect/components/render.hpp"

using namespace Systems;
using namespace Components;

class RenderSyncTest : public ::testing::Test {
protected:
    entt::registry registry;
    RenderSyncSystem system;

    void SetUp() override {
        SystemConfig cfg;
        cfg.TileSize = 40.0;
        system.setSystemConfig(cfg);
    }
};

TEST_F(RenderSyncTest, FirstSyncSnaps) {
    auto e = registry.create();
    registry.emplace<Position>(e, 2.0, -1.0);
    registry.emplace<RenderPose>(e, 3.0);

    system.sync(registry);

    const auto& pose = registry.get<RenderPose>(e);
    EXPECT_TRUE(pose.placed);
    EXPECT_DOUBLE_EQ(pose.x, 80.0);
    EXPECT_DOUBLE_EQ(pose.y, -40.0);
    EXPECT_DOUBLE_EQ(pose.z, 3.0);
}

TEST_F(RenderSyncTest, LaterSyncsInterpolate) {
    auto e = registry.create();
    registry.emplace<Position>(e, 0.0, 0.0);
    registry.emplace<RenderPose>(e);
    system.sync(registry);

    registry.replace<Position>(e, 1.0, 0.0);
    system.sync(registry);

    const auto& pose = registry.get<RenderPose>(e);
    EXPECT_NEAR(pose.x, 40.0 * 0.2, 1e-12);
    EXPECT_DOUBLE_EQ(pose.y, 0.0);

    system.sync(registry);
    EXPECT_NEAR(pose.x, 8.0 + (40.0 - 8.0) * 0.2, 1e-12);
}

TEST_F(RenderSyncTest, ConvergesToTarget) {
    auto e = registry.create();
    registry.emplace<Position>(e, 0.0, 0.0);
    registry.emplace<RenderPose>(e);
    system.sync(registry);

    registry.replace<Position>(e, -2.0, 3.0);
    for (int i = 0; i < 200; ++i) {
        system.sync(registry);
    }

    const auto& pose = registry.get<RenderPose>(e);
    EXPECT_NEAR(pose.x, -80.0, 1e-6);
    EXPECT_NEAR(pose.y, 120.0, 1e-6);
}

TEST_F(RenderSyncTest, CustomLerpFactor) {
    system.setSpecificConfig({1.0});
    auto e = registry.create();
    registry.emplace<Position>(e, 0.0, 0.0);
    registry.emplace<RenderPose>(e);
    system.sync(registry);

    registry.replace<Position>(e, 1.0, 1.0);
    system.sync(registry);

    const auto& pose = registry.get<RenderPose>(e);
    EXPECT_DOUBLE_EQ(pose.x, 40.0);
    EXPECT_DOUBLE_EQ(pose.y, 40.0);
}
