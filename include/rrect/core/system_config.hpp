#pragma once

#include <vector>

#include "rrect/core/constants.hpp"
#include "rrect/systems/systems.hpp"

/**
 * @struct SystemConfig
 * @brief Holds the configuration shared by all physics systems.
 */
struct SystemConfig {
    double SecondsPerTick = PhysicsConstants::DefaultSecondsPerTick;  ///< Fixed timestep used by tick()
    double CellSize = PhysicsConstants::DefaultCellSize;              ///< Spatial hash grid cell edge
    double TileSize = PhysicsConstants::DefaultTileSize;              ///< Render units per world unit

    std::vector<Systems::SystemType> activeSystems = {
        Systems::SystemType::INTEGRATION,
        Systems::SystemType::SPATIAL_GRID,
        Systems::SystemType::COLLISION,
    };

    /**
     * @brief Checks every field and reports the first problem to std::cerr
     * @return true if the config can be applied
     */
    bool validate() const;
};
