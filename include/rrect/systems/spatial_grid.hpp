/**
 * @file spatial_grid.hpp
 * @brief System keeping the spatial hash grid in sync with the registry
 *
 * This system handles:
 * - Re-indexing every entity that has Position and Collider
 * - Dropping grid entries of entities that no longer have both
 *   (destroyed, or a component removed); detected by absence
 *
 * Required components:
 * - Position (bounds centre)
 * - Collider (bounds size)
 */

#pragma once

#include <entt/entt.hpp>

#include "rrect/systems/i_system.hpp"

namespace Systems {

/**
 * @class SpatialGridSystem
 * @brief Refreshes PhysicsContext::grid once per tick, after integration
 */
class SpatialGridSystem : public ISystem {
public:
    SpatialGridSystem() = default;
    ~SpatialGridSystem() override = default;

    void update(entt::registry &registry, PhysicsContext &context) override;
};

} // namespace Systems
