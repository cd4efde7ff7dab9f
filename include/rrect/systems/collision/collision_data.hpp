/**
 * @file collision_data.hpp
 * @brief Declaration of collision data structures
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>

/**
 * @brief Unordered pair of entities whose colliders overlapped this tick
 *
 * entity_a is the entity whose neighbour search found the pair.
 */
struct CollisionEvent {
    entt::entity entity_a;
    entt::entity entity_b;

    /** @brief true if the event names e on either side */
    bool involves(entt::entity e) const { return entity_a == e || entity_b == e; }
};

using CollisionEvents = std::vector<CollisionEvent>;
