#pragma once

/**
 * @brief Defines the ECS systems of the physics pipeline.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief Systems that can be activated in a SystemConfig.
 *
 * The simulator always runs active systems in the order listed here:
 * integration first, then the grid refresh, then collision resolution.
 */
enum class SystemType {
    INTEGRATION,
    SPATIAL_GRID,
    COLLISION,
};

} // namespace Systems
