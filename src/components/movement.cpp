/**
 * @file movement.cpp
 * @brief Force mixing and damping rules
 */

#include "rrect/components/basic.hpp"
#include "rrect/core/constants.hpp"

#include <utility>

namespace Components {

Force::Force() : id(PhysicsConstants::DefaultForceName), force(), active(false) {}

Force::Force(std::string id, Vector force, bool active)
    : id(std::move(id)), force(force), active(active) {}

Force Force::mix(const PartialForce& partial) const {
    return {id,
            partial.force.value_or(force),
            partial.active.value_or(active)};
}

Force Force::fromPartial(const PartialForce& partial) {
    return {partial.id,
            partial.force.value_or(Vector()),
            partial.active.value_or(false)};
}

Movement Movement::damped(const Vector& damping) {
    Movement movement;
    movement.damping = damping;
    return movement;
}

void Movement::applyForce(const PartialForce& partial) {
    auto it = forces.find(partial.id);
    if (it != forces.end()) {
        it->second = it->second.mix(partial);
    } else {
        forces.emplace(partial.id, Force::fromPartial(partial));
    }
}

bool Movement::removeForce(const std::string& id) {
    return forces.erase(id) > 0;
}

void Movement::applyDamping(double dt) {
    Vector const factor = damping * dt;
    for (auto& [id, f] : forces) {
        if (!f.active) {
            f.force *= factor;
        }
    }
}

} // namespace Components
