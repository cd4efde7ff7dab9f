/**
 * @file narrow_phase.cpp
 * @brief Rounded-rectangle MTV computation
 */

#include "rrect/systems/collision/narrow_phase.hpp"

#include <cmath>

namespace RRectCollision {

/**
 * @brief MTV of two overlapping plain rectangles along the shallower axis
 */
static Vector innerRectMtv(const Vector& offset, const Vector& offsetAbs, const Vector& avgSize) {
    Vector const overlap = avgSize - offsetAbs;
    if (overlap.x < overlap.y) {
        return {overlap.x * signum(offset.x), 0.0};
    }
    return {0.0, overlap.y * signum(offset.y)};
}

std::optional<Vector> computeMtv(const Components::Position& posA,
                                 const Components::Collider& a,
                                 const Components::Position& posB,
                                 const Components::Collider& b)
{
    Vector const offset = posB - posA;
    Vector const offsetAbs = offset.abs();
    Vector const avgSize = (a.size + b.size) * 0.5;

    if (offsetAbs.x >= avgSize.x || offsetAbs.y >= avgSize.y) {
        return std::nullopt;
    }

    double const radii = a.radius + b.radius;
    // Per-axis distance between the inner rectangles (size minus corner radii)
    Vector const dist = offsetAbs - avgSize + radii;

    if (dist.x < 0.0 || dist.y < 0.0) {
        return innerRectMtv(offset, offsetAbs, avgSize);
    }

    double const distSq = dist.lengthSquared();
    if (distSq > radii * radii) {
        return std::nullopt;
    }

    double const distLength = std::sqrt(distSq);
    if (distLength < EPSILON) {
        // Corner circle centres coincide, no normal to push along
        return innerRectMtv(offset, offsetAbs, avgSize);
    }

    return (dist / distLength) * (radii - distLength) * offset.signum();
}

} // namespace RRectCollision
