/**
 * @file narrow_phase.hpp
 * @brief Exact overlap test between two axis-aligned rounded rectangles
 *
 * The test runs in three stages:
 * - AABB reject on the full rectangles
 * - Inner-rectangle case: the shapes overlap as plain rectangles once the
 *   corner radii are taken off, push along the shallower axis
 * - Corner case: the corner regions are tested as two circles whose
 *   combined radius is radiusA + radiusB, push along the corner normal
 */

#pragma once

#include <optional>

#include "rrect/components/basic.hpp"
#include "rrect/math/vector_math.hpp"

namespace RRectCollision {

/**
 * @brief Minimum translation vector between two colliders
 *
 * The returned vector points from A towards B: subtracting it from A's
 * position (or adding it to B's) separates the shapes.
 *
 * @param posA Centre of collider A
 * @param a Collider A
 * @param posB Centre of collider B
 * @param b Collider B
 * @return nullopt if the shapes do not overlap
 */
std::optional<Vector> computeMtv(const Components::Position& posA,
                                 const Components::Collider& a,
                                 const Components::Position& posB,
                                 const Components::Collider& b);

} // namespace RRectCollision
