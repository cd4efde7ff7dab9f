/**
 * @file spatial_grid.cpp
 * @brief Per-tick grid refresh and removal of vanished entities
 */

#include "rrect/systems/spatial_grid.hpp"
#include "rrect/components/basic.hpp"
#include "rrect/core/debug.hpp"
#include "rrect/core/profile.hpp"

#include <unordered_set>
#include <vector>

namespace Systems {

void SpatialGridSystem::update(entt::registry &registry, PhysicsContext &context) {
    RRECT_PROFILE_SCOPE("SpatialGridSystem");

    auto& grid = context.grid;
    std::size_t const mutationsBefore = grid.mutationCount();

    std::unordered_set<entt::entity> live;
    auto view = registry.view<Components::Position, Components::Collider>();
    for (auto [entity, pos, collider] : view.each()) {
        live.insert(entity);
        grid.insertOrUpdate(entity, pos, collider);
    }

    std::vector<entt::entity> vanished;
    for (auto entity : grid.trackedEntities()) {
        if (live.find(entity) == live.end()) {
            vanished.push_back(entity);
        }
    }

    for (auto entity : vanished) {
        grid.remove(entity);
        PhysicsDebugStats::countGridRemoval();
        RRECT_DEBUG_MSG(RRECT_DEBUG_LEVEL_VERBOSE,
            "Grid dropped entity " << entt::to_integral(entity) << "\n");
    }

    PhysicsDebugStats::countGridUpdates(grid.mutationCount() - mutationsBefore);
}

} // namespace Systems
