/**
 * @file integration.hpp
 * @brief System turning accumulated forces into velocity and position
 *
 * This system handles, per entity and per tick:
 * - Damping of inactive forces
 * - Recomputing velocity from the current force set (no carry-over)
 * - Clamping velocity to MaxVelocity * dt
 * - Advancing position by velocity
 *
 * Required components:
 * - Movement (forces to read, velocity to write)
 * - Position (to modify)
 */

#ifndef INTEGRATION_SYSTEM_HPP
#define INTEGRATION_SYSTEM_HPP

#include <entt/entt.hpp>

#include "rrect/components/basic.hpp"
#include "rrect/systems/i_system.hpp"

namespace Systems {

/**
 * @class IntegrationSystem
 * @brief Explicit force integration with velocity clamping
 */
class IntegrationSystem : public ISystem {
public:
    IntegrationSystem() = default;
    ~IntegrationSystem() override = default;

    /**
     * @brief Integrates every entity with Movement and Position by context.dt
     */
    void update(entt::registry &registry, PhysicsContext &context) override;

    /**
     * @brief Single-body step, shared with tests and hosts that bypass the registry
     * @return true if the velocity had to be clamped
     */
    static bool integrate(Components::Movement &movement, Components::Position &position, double dt);
};

} // namespace Systems

#endif
