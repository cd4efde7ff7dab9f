#include "rrect/systems/render_sync.hpp"
#include "rrect/components/basic.hpp"
#include "rrect/components/render.hpp"
#include "rrect/core/profile.hpp"

namespace Systems {

void RenderSyncSystem::update(entt::registry &registry, PhysicsContext & /*context*/) {
    sync(registry);
}

void RenderSyncSystem::sync(entt::registry &registry) {
    RRECT_PROFILE_SCOPE("RenderSyncSystem");

    double const scale = sysConfig.TileSize;
    double const t = specificConfig.lerpFactor;

    auto view = registry.view<Components::Position, Components::RenderPose>();
    for (auto [entity, pos, pose] : view.each()) {
        double const targetX = pos.x * scale;
        double const targetY = pos.y * scale;

        if (!pose.placed) {
            pose.x = targetX;
            pose.y = targetY;
            pose.placed = true;
            continue;
        }

        pose.x += (targetX - pose.x) * t;
        pose.y += (targetY - pose.y) * t;
    }
}

} // namespace Systems
