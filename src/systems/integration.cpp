#include "rrect/systems/integration.hpp"
#include "rrect/core/constants.hpp"
#include "rrect/core/debug.hpp"
#include "rrect/core/profile.hpp"

namespace Systems {

bool IntegrationSystem::integrate(Components::Movement &movement, Components::Position &position, double dt) {
    movement.velocity = Vector();
    movement.applyDamping(dt);

    Vector sum;
    for (const auto& [id, force] : movement.forces) {
        sum += force.force * dt;
    }

    double const maxSpeed = PhysicsConstants::MaxVelocity * dt;
    movement.velocity = sum.clampLength(maxSpeed);

    position += movement.velocity;
    return movement.velocity != sum;
}

void IntegrationSystem::update(entt::registry &registry, PhysicsContext &context) {
    RRECT_PROFILE_SCOPE("IntegrationSystem");

    auto view = registry.view<Components::Movement, Components::Position>();
    for (auto [entity, movement, pos] : view.each()) {
        if (integrate(movement, pos, context.dt)) {
            PhysicsDebugStats::countVelocityClamp();
            RRECT_DEBUG_MSG(RRECT_DEBUG_LEVEL_VERBOSE,
                "Velocity clamped for entity " << entt::to_integral(entity) << "\n");
        }
    }
}

} // namespace Systems
