/**
 * @file simulator.hpp
 * @brief Owner of the registry, the physics context and the system pipeline.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include <entt/entt.hpp>

#include "rrect/core/physics_context.hpp"
#include "rrect/core/system_config.hpp"
#include "rrect/systems/i_system.hpp"
#include "rrect/systems/render_sync.hpp"

/**
 * @class PhysicsSimulator
 * @brief Runs integration, grid refresh and collision resolution once per tick.
 *
 * The host creates entities in getRegistry() and attaches Position,
 * Movement, Collider and optionally RenderPose. tick() is called on a fixed
 * cadence; updatePresentation() once per rendered frame.
 */
class PhysicsSimulator {
public:
    PhysicsSimulator();
    explicit PhysicsSimulator(const SystemConfig& cfg);
    ~PhysicsSimulator();

    PhysicsSimulator(const PhysicsSimulator&) = delete;
    PhysicsSimulator& operator=(const PhysicsSimulator&) = delete;

    /**
     * @brief Installs a new configuration
     *
     * The system list is rebuilt only when activeSystems changed.
     * @return false if cfg is invalid; the previous config stays active
     */
    bool applyConfig(const SystemConfig& cfg);

    const SystemConfig& getConfig() const { return currentConfig; }

    /**
     * @brief Steps the active systems once with the given timestep
     */
    void tick(double dt);

    /**
     * @brief Steps once with the configured SecondsPerTick
     */
    void tick();

    /**
     * @brief Moves render poses towards the current positions
     */
    void updatePresentation();

    /**
     * @brief Collision events produced by the last tick
     */
    const CollisionEvents& collisionEvents() const { return context.collisionEvents; }

    /**
     * @brief Total ticks run since construction
     */
    std::size_t tickCount() const { return ticks; }

    entt::registry& getRegistry();
    const entt::registry& getRegistry() const;

    PhysicsContext& getContext() { return context; }
    const PhysicsContext& getContext() const { return context; }

    /**
     * @brief Looks up an active system by type, nullptr if inactive
     */
    Systems::ISystem* getSystem(Systems::SystemType type);

    template <typename T>
    T* getSystem(Systems::SystemType type) {
        return dynamic_cast<T*>(getSystem(type));
    }

    Systems::RenderSyncSystem& getRenderSync() { return renderSync; }

private:
    void createSystems();

    entt::registry registry;
    SystemConfig currentConfig;
    PhysicsContext context;

    std::vector<std::pair<Systems::SystemType, std::unique_ptr<Systems::ISystem>>> systems;
    Systems::RenderSyncSystem renderSync;

    std::size_t ticks = 0;
};
