#include <gtest/gtest.h>
#include "rrect/systems/collision/collision_resolver.hpp"
#include "rrect/systems/spatial_grid.hpp"
#include "rrect/components/basic.hpp"

using namespace Systems;
using namespace Components;

class CollisionResolverTest : public ::testing::Test {
protected:
    entt::registry registry;
    PhysicsContext context{20.0};
    SpatialGridSystem gridSystem;
    CollisionResolverSystem resolver;

    entt::entity createBody(double x, double y, const Collider& collider) {
        auto entity = registry.create();
        registry.emplace<Position>(entity, x, y);
        registry.emplace<Collider>(entity, collider);
        return entity;
    }

    static Collider box(ColliderType type) {
        return Collider::rect(Vector(1.0, 1.0), type);
    }

    void step() {
        context.collisionEvents.clear();
        gridSystem.update(registry, context);
        resolver.update(registry, context);
    }

    const Position& pos(entt::entity e) {
        return registry.get<Position>(e);
    }
};

TEST_F(CollisionResolverTest, StaticPushOut) {
    auto wall = createBody(0.0, 0.0, box(ColliderType::staticBody()));
    auto body = createBody(0.5, 0.0, box(ColliderType::dynamic(1.0)));

    step();

    ASSERT_EQ(context.collisionEvents.size(), 1u);
    EXPECT_TRUE(context.collisionEvents[0].involves(wall));
    EXPECT_TRUE(context.collisionEvents[0].involves(body));
    EXPECT_NEAR(pos(body).x, 1.0, 1e-12);
    EXPECT_NEAR(pos(body).y, 0.0, 1e-12);
    EXPECT_EQ(pos(wall), Position(0.0, 0.0));
}

TEST_F(CollisionResolverTest, EqualMassSplit) {
    auto a = createBody(0.0, 0.0, box(ColliderType::dynamic(1.0)));
    auto b = createBody(0.5, 0.0, box(ColliderType::dynamic(1.0)));

    step();

    ASSERT_EQ(context.collisionEvents.size(), 1u);
    EXPECT_NEAR(pos(a).x, -0.25, 1e-12);
    EXPECT_NEAR(pos(b).x, 0.75, 1e-12);
    EXPECT_NEAR(pos(b).x - pos(a).x, 1.0, 1e-12);
}

TEST_F(CollisionResolverTest, UnequalMassSplit) {
    auto heavy = createBody(0.0, 0.0, box(ColliderType::dynamic(4.0)));
    auto light = createBody(0.5, 0.0, box(ColliderType::dynamic(1.0)));

    step();

    // Heavy moves MTV * 1/5, light moves MTV * 4/5
    EXPECT_NEAR(pos(heavy).x, -0.1, 1e-12);
    EXPECT_NEAR(pos(light).x, 0.9, 1e-12);
    EXPECT_NEAR((pos(light).x - 0.5) / (0.0 - pos(heavy).x), 4.0, 1e-9);
}

TEST_F(CollisionResolverTest, NoOverlapNoEvent) {
    auto a = createBody(0.0, 0.0, box(ColliderType::dynamic(1.0)));
    auto b = createBody(2.0, 0.0, box(ColliderType::dynamic(1.0)));

    step();

    EXPECT_TRUE(context.collisionEvents.empty());
    EXPECT_EQ(pos(a), Position(0.0, 0.0));
    EXPECT_EQ(pos(b), Position(2.0, 0.0));
}

TEST_F(CollisionResolverTest, OnePairOneEvent) {
    // Both bodies see each other as neighbours; the pair is processed once
    createBody(0.0, 0.0, box(ColliderType::sensor()));
    createBody(0.3, 0.3, box(ColliderType::sensor()));

    step();
    EXPECT_EQ(context.collisionEvents.size(), 1u);

    step();
    EXPECT_EQ(context.collisionEvents.size(), 1u);
}

TEST_F(CollisionResolverTest, SensorsAreNotifiedButNotMoved) {
    auto sensor = createBody(0.0, 0.0, box(ColliderType::sensor()));
    auto body = createBody(0.5, 0.0, box(ColliderType::dynamic(1.0)));
    auto wall = createBody(-0.5, 0.0, box(ColliderType::staticBody()));

    step();

    std::size_t sensorEvents = 0;
    for (const auto& ev : context.collisionEvents) {
        if (ev.involves(sensor)) {
            ++sensorEvents;
        }
    }
    EXPECT_EQ(sensorEvents, 2u);
    EXPECT_EQ(pos(sensor), Position(0.0, 0.0));
    EXPECT_EQ(pos(wall), Position(-0.5, 0.0));
    // The dynamic body touches the wall edge exactly, so only the sensor hit it
    EXPECT_EQ(pos(body), Position(0.5, 0.0));
}

TEST_F(CollisionResolverTest, StaticPairsAreNeverTested) {
    createBody(0.0, 0.0, box(ColliderType::staticBody()));
    createBody(0.2, 0.0, box(ColliderType::staticBody()));

    step();

    EXPECT_TRUE(context.collisionEvents.empty());
}

TEST_F(CollisionResolverTest, UntrackedBodiesAreSkipped) {
    auto a = createBody(0.0, 0.0, box(ColliderType::dynamic(1.0)));
    auto b = createBody(0.5, 0.0, box(ColliderType::dynamic(1.0)));

    // No grid refresh: neither body is tracked yet
    resolver.update(registry, context);

    EXPECT_TRUE(context.collisionEvents.empty());
    EXPECT_EQ(pos(a), Position(0.0, 0.0));
    EXPECT_EQ(pos(b), Position(0.5, 0.0));
}

TEST_F(CollisionResolverTest, LaterPairSeesEarlierPush) {
    // b is pushed by a first (lower ids go first), then tested against c
    auto a = createBody(0.0, 0.0, box(ColliderType::dynamic(1.0)));
    auto b = createBody(0.5, 0.0, box(ColliderType::dynamic(1.0)));
    auto c = createBody(1.5, 0.0, box(ColliderType::dynamic(1.0)));

    step();

    // a/b: b -> 0.75, a -> -0.25. b/c then overlap by 0.25: b -> 0.625, c -> 1.625
    ASSERT_EQ(context.collisionEvents.size(), 2u);
    EXPECT_NEAR(pos(a).x, -0.25, 1e-12);
    EXPECT_NEAR(pos(b).x, 0.625, 1e-12);
    EXPECT_NEAR(pos(c).x, 1.625, 1e-12);
}

TEST_F(CollisionResolverTest, StableOrderIsReproducible) {
    auto run = [](bool stable) {
        entt::registry reg;
        PhysicsContext ctx{20.0};
        SpatialGridSystem grid;
        CollisionResolverSystem res;
        res.setSpecificConfig({stable});

        std::vector<entt::entity> bodies;
        for (int i = 0; i < 12; ++i) {
            auto e = reg.create();
            reg.emplace<Position>(e, 0.3 * i, 0.1 * (i % 3));
            reg.emplace<Collider>(e, Collider(Vector(1.0, 1.0), 0.1, ColliderType::dynamic(1.0 + i % 4)));
            bodies.push_back(e);
        }
        grid.update(reg, ctx);
        res.update(reg, ctx);

        std::vector<Position> result;
        for (auto e : bodies) {
            result.push_back(reg.get<Position>(e));
        }
        return result;
    };

    auto first = run(true);
    auto second = run(true);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i], second[i]);
    }
}

TEST_F(CollisionResolverTest, EventsAppendToContext) {
    createBody(0.0, 0.0, box(ColliderType::dynamic(1.0)));
    createBody(0.5, 0.0, box(ColliderType::dynamic(1.0)));

    context.collisionEvents.clear();
    gridSystem.update(registry, context);
    resolver.update(registry, context);
    resolver.update(registry, context);

    // Second pass runs on already separated bodies
    EXPECT_EQ(context.collisionEvents.size(), 1u);
}
