/**
 * @file basic.hpp
 * @brief Plain component structs attached to entities by the host
 *
 * - Position: simulation-space location
 * - Movement: velocity, named forces and damping of inactive forces
 * - Collider: axis-aligned rounded rectangle plus its response type
 */

#ifndef COMPONENTS_BASIC_HPP
#define COMPONENTS_BASIC_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include "rrect/math/vector_math.hpp"

namespace Components {

    // Use the Position class from vector_math.hpp
    using Position = ::Position;

    /**
     * @brief Sparse update request for a named force
     *
     * Unset fields keep the value of the existing force (see Force::mix).
     */
    struct PartialForce {
        std::string id;
        std::optional<Vector> force;
        std::optional<bool> active;
    };

    /**
     * @brief A named force acting on a body
     *
     * Forces compare equal when their ids match. Active forces are driven
     * externally (e.g. input); inactive forces are residual impulses that
     * Movement::applyDamping bleeds off every tick.
     */
    struct Force {
        std::string id;
        Vector force;
        bool active = false;

        Force();
        Force(std::string id, Vector force, bool active);

        /**
         * @brief Merges a partial update into a copy of this force
         * @param partial Fields to override; the id of this force is kept
         */
        Force mix(const PartialForce& partial) const;

        /**
         * @brief Materialises a partial: zero vector and inactive when unset
         */
        static Force fromPartial(const PartialForce& partial);

        bool operator==(const Force& other) const { return id == other.id; }
        bool operator!=(const Force& other) const { return id != other.id; }
    };

    struct ForceHash {
        std::size_t operator()(const Force& f) const {
            return std::hash<std::string>{}(f.id);
        }
    };

    /**
     * @brief Velocity and the forces it is recomputed from each tick
     *
     * Do not write velocity or force entries directly; use applyForce().
     */
    struct Movement {
        Vector velocity;                                 ///< Displacement applied this tick
        std::unordered_map<std::string, Force> forces;   ///< Keyed by Force::id
        Vector damping;                                  ///< Multiplier for inactive forces, scaled by dt

        /** @brief Movement with no forces and the given damping */
        static Movement damped(const Vector& damping);

        /**
         * @brief Adds a force or mixes the partial into the force with the same id
         */
        void applyForce(const PartialForce& partial);

        /**
         * @brief Removes the force with the given id
         * @return true if a force was removed
         */
        bool removeForce(const std::string& id);

        /**
         * @brief Scales every inactive force component-wise by damping * dt
         */
        void applyDamping(double dt);
    };

    enum class ColliderKind {
        Sensor,   ///< Reports collisions, never corrected
        Static,   ///< Never moves when hit
        Dynamic   ///< Pushed away by mass ratio
    };

    /**
     * @brief Collision response type; mass is only meaningful for Dynamic
     */
    struct ColliderType {
        ColliderKind kind = ColliderKind::Sensor;
        double mass = 0.0;

        static ColliderType sensor();
        static ColliderType staticBody();

        /** @brief Dynamic type; mass must be finite and > 0 */
        static ColliderType dynamic(double mass);

        bool isSensor() const { return kind == ColliderKind::Sensor; }
        bool isStatic() const { return kind == ColliderKind::Static; }
        bool isDynamic() const { return kind == ColliderKind::Dynamic; }
    };

    /**
     * @brief Axis-aligned rectangle of full size `size` with corners rounded by `radius`
     *
     * radius * 2 must fit in both size.x and size.y.
     */
    struct Collider {
        Vector size;
        double radius;
        ColliderType type;

        /** @brief Unit square, default radius, Sensor */
        Collider();
        Collider(const Vector& size, double radius, ColliderType type);

        /** @brief Sharp-cornered rectangle */
        static Collider rect(const Vector& size, ColliderType type);

        /** @brief Square whose corners form a full circle of the given radius */
        static Collider circle(double radius, ColliderType type);
    };

} // namespace Components

#endif
