/**
 * @file collision_resolver.cpp
 * @brief Pair iteration, event emission and mass-weighted push-out
 */

#include "rrect/systems/collision/collision_resolver.hpp"
#include "rrect/components/basic.hpp"
#include "rrect/core/debug.hpp"
#include "rrect/core/profile.hpp"
#include "rrect/systems/collision/narrow_phase.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Systems {

/**
 * @brief Collider state captured before any push of this pass
 */
struct BodySnapshot {
    Components::Position position;
    Components::Collider collider;
};

static bool byEntityId(entt::entity lhs, entt::entity rhs) {
    return entt::to_integral(lhs) < entt::to_integral(rhs);
}

/**
 * @brief Moves dynamic bodies apart; positions already include earlier pushes
 */
static void resolvePair(entt::entity a, const Components::ColliderType &typeA, const Components::Position &posA,
                        entt::entity b, const Components::ColliderType &typeB, const Components::Position &posB,
                        const Vector &mtv,
                        std::unordered_map<entt::entity, Components::Position> &overrides)
{
    if (typeA.isDynamic() && typeB.isStatic()) {
        overrides[a] = posA - mtv;
    } else if (typeA.isStatic() && typeB.isDynamic()) {
        overrides[b] = posB + mtv;
    } else if (typeA.isDynamic() && typeB.isDynamic()) {
        double const totalMass = typeA.mass + typeB.mass;
        double const shareA = typeA.mass / totalMass;
        double const shareB = typeB.mass / totalMass;

        overrides[a] = posA - mtv * shareB;
        overrides[b] = posB + mtv * shareA;
    }
    // Sensor pairs and Static/Static: notification only
}

void CollisionResolverSystem::update(entt::registry &registry, PhysicsContext &context) {
    RRECT_PROFILE_SCOPE("CollisionResolverSystem");

    auto view = registry.view<Components::Position, Components::Collider>();

    std::unordered_map<entt::entity, BodySnapshot> snapshot;
    std::vector<entt::entity> order;
    for (auto [entity, pos, collider] : view.each()) {
        snapshot.emplace(entity, BodySnapshot{pos, collider});
        order.push_back(entity);
    }
    if (specificConfig.stableOrder) {
        std::sort(order.begin(), order.end(), byEntityId);
    }

    // Only Dynamic bodies ever get an entry
    std::unordered_map<entt::entity, Components::Position> overrides;
    std::set<std::pair<entt::entity, entt::entity>> checked;

    auto currentPosition = [&overrides](entt::entity e, const BodySnapshot &body) {
        auto it = overrides.find(e);
        return it != overrides.end() ? it->second : body.position;
    };

    std::vector<entt::entity> candidates;
    for (auto entityA : order) {
        const BodySnapshot &bodyA = snapshot.at(entityA);

        // Static bodies never start a search; they are still found as neighbours
        if (bodyA.collider.type.isStatic()) {
            continue;
        }

        auto neighbors = context.grid.neighbors(entityA);
        if (!neighbors) {
            continue;
        }

        candidates.assign(neighbors->begin(), neighbors->end());
        if (specificConfig.stableOrder) {
            std::sort(candidates.begin(), candidates.end(), byEntityId);
        }

        for (auto entityB : candidates) {
            if (entityB == entityA) {
                continue;
            }

            auto itB = snapshot.find(entityB);
            if (itB == snapshot.end()) {
                continue;
            }
            const BodySnapshot &bodyB = itB->second;

            auto pair = byEntityId(entityA, entityB) ? std::make_pair(entityA, entityB)
                                                     : std::make_pair(entityB, entityA);
            if (!checked.insert(pair).second) {
                continue;
            }
            PhysicsDebugStats::countPairTested();

            Components::Position const posA = currentPosition(entityA, bodyA);
            Components::Position const posB = currentPosition(entityB, bodyB);

            auto mtv = RRectCollision::computeMtv(posA, bodyA.collider, posB, bodyB.collider);
            if (!mtv) {
                continue;
            }

            context.collisionEvents.push_back({entityA, entityB});
            PhysicsDebugStats::countCollision();
            RRECT_DEBUG_MSG(RRECT_DEBUG_LEVEL_VERBOSE,
                "Collision " << entt::to_integral(entityA) << " <-> " << entt::to_integral(entityB)
                << " mtv (" << mtv->x << ", " << mtv->y << ")\n");

            resolvePair(entityA, bodyA.collider.type, posA,
                        entityB, bodyB.collider.type, posB,
                        *mtv, overrides);
        }
    }

    for (const auto &[entity, pos] : overrides) {
        registry.replace<Components::Position>(entity, pos);
    }
}

} // namespace Systems
