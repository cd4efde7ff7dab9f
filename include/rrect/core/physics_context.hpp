/**
 * @file physics_context.hpp
 * @brief State shared by the physics systems during a tick
 */

#pragma once

#include "rrect/spatial/spatial_hash_grid.hpp"
#include "rrect/systems/collision/collision_data.hpp"

/**
 * @struct PhysicsContext
 * @brief Owned by the simulator and passed by reference into each system
 *
 * The grid persists across ticks. The event list holds the events of the
 * current tick and is cleared when the next one starts.
 */
struct PhysicsContext {
    double dt = 0.0;
    Spatial::SpatialHashGrid grid;
    CollisionEvents collisionEvents;

    explicit PhysicsContext(double cellSize) : grid(cellSize) {}
};
