/**
 * @file render_sync.hpp
 * @brief System deriving render poses from simulation positions
 *
 * Runs once per rendered frame, outside the fixed physics tick. The target
 * pose is Position * TileSize. A pose seen for the first time snaps to the
 * target; afterwards it eases towards it so a fixed-rate simulation still
 * moves smoothly on screen.
 *
 * Required components:
 * - Position (to read)
 * - RenderPose (to modify)
 */

#pragma once

#include <entt/entt.hpp>

#include "rrect/core/constants.hpp"
#include "rrect/systems/i_system.hpp"

namespace Systems {

/**
 * @struct RenderSyncConfig
 * @brief Configuration parameters specific to render sync
 */
struct RenderSyncConfig {
    // Fraction of the remaining distance covered per frame (0-1]
    double lerpFactor = PhysicsConstants::RenderLerpFactor;
};

/**
 * @class RenderSyncSystem
 * @brief Interpolates RenderPose towards the scaled Position
 */
class RenderSyncSystem : public ConfigurableSystem<RenderSyncConfig> {
public:
    RenderSyncSystem() = default;
    ~RenderSyncSystem() override = default;

    /**
     * @brief Updates every RenderPose; the context is not used
     */
    void update(entt::registry &registry, PhysicsContext &context) override;

    /**
     * @brief Same as update() for callers that hold no PhysicsContext
     */
    void sync(entt::registry &registry);
};

} // namespace Systems
