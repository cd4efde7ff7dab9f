#include "rrect/components/basic.hpp"
#include "rrect/core/constants.hpp"

#include <cassert>
#include <cmath>

namespace Components {

ColliderType ColliderType::sensor() {
    return {ColliderKind::Sensor, 0.0};
}

ColliderType ColliderType::staticBody() {
    return {ColliderKind::Static, 0.0};
}

ColliderType ColliderType::dynamic(double mass) {
    assert(std::isfinite(mass) && mass > 0.0 && "Dynamic mass must be finite and > 0.");
    return {ColliderKind::Dynamic, mass};
}

Collider::Collider()
    : Collider(Vector(1.0, 1.0), PhysicsConstants::DefaultColliderRadius, ColliderType::sensor()) {}

Collider::Collider(const Vector& size, double radius, ColliderType type)
    : size(size), radius(radius), type(type)
{
    assert(size.x >= radius * 2.0 && "Collider corners must fit inside its width.");
    assert(size.y >= radius * 2.0 && "Collider corners must fit inside its height.");
}

Collider Collider::rect(const Vector& size, ColliderType type) {
    return {size, 0.0, type};
}

Collider Collider::circle(double radius, ColliderType type) {
    return {Vector::splat(radius * 2.0), radius, type};
}

} // namespace Components
