/**
 * @file collision_resolver.hpp
 * @brief Narrow-phase collision detection and positional push-out
 *
 * Runs once per tick after the grid refresh. For every pair of entities that
 * share a grid cell it tests the rounded rectangles, records a
 * CollisionEvent and separates the bodies according to their types:
 * - Dynamic vs Static: the dynamic body takes the full MTV
 * - Dynamic vs Dynamic: the MTV is split by mass ratio, heavier moves less
 * - Anything involving a Sensor: event only
 *
 * Pushes are accumulated in a per-pass override map and written back at the
 * end, so a body hit twice in the same tick sees its first push when the
 * second pair is evaluated.
 *
 * Required components:
 * - Position (read, and written for Dynamic bodies)
 * - Collider
 */

#pragma once

#include <entt/entt.hpp>

#include "rrect/systems/i_system.hpp"

namespace Systems {

/**
 * @struct CollisionConfig
 * @brief Configuration parameters specific to collision resolution
 */
struct CollisionConfig {
    // Visit bodies and their neighbours in ascending entity id. Off means
    // container order, which can change results between runs when a body
    // is part of several overlaps.
    bool stableOrder = true;
};

/**
 * @class CollisionResolverSystem
 * @brief Single-pass rounded-rectangle collision resolution
 */
class CollisionResolverSystem : public ConfigurableSystem<CollisionConfig> {
public:
    CollisionResolverSystem() = default;
    ~CollisionResolverSystem() override = default;

    /**
     * @brief Tests and resolves every candidate pair from context.grid
     *
     * Appends one event per overlapping pair to context.collisionEvents.
     */
    void update(entt::registry &registry, PhysicsContext &context) override;
};

} // namespace Systems
