/**
 * @fileoverview simulator.cpp
 * @brief Implementation of PhysicsSimulator.
 */

#include "rrect/core/simulator.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "rrect/core/debug.hpp"
#include "rrect/core/profile.hpp"
#include "rrect/systems/collision/collision_resolver.hpp"
#include "rrect/systems/integration.hpp"
#include "rrect/systems/spatial_grid.hpp"

PhysicsSimulator::PhysicsSimulator() : PhysicsSimulator(SystemConfig{}) {}

PhysicsSimulator::PhysicsSimulator(const SystemConfig& cfg)
  : currentConfig(cfg)
  , context(cfg.CellSize)
{
  createSystems();
}

PhysicsSimulator::~PhysicsSimulator() = default;

bool PhysicsSimulator::applyConfig(const SystemConfig& cfg) {
  if (!cfg.validate()) {
    std::cerr << "PhysicsSimulator::applyConfig(): rejected, keeping previous config" << std::endl;
    return false;
  }

  // Cells depend on the cell size; entries come back on the next refresh
  if (cfg.CellSize != currentConfig.CellSize) {
    context.grid = Spatial::SpatialHashGrid(cfg.CellSize);
  }

  bool const rebuild = cfg.activeSystems != currentConfig.activeSystems;
  currentConfig = cfg;

  if (rebuild) {
    createSystems();
  } else {
    // Keep existing systems so their specific configs survive
    for (auto& [type, system] : systems) {
      system->setSystemConfig(currentConfig);
    }
    renderSync.setSystemConfig(currentConfig);
  }
  return true;
}

void PhysicsSimulator::createSystems() {
  systems.clear();

  // Phase order is fixed regardless of the order in activeSystems
  const Systems::SystemType pipeline[] = {
    Systems::SystemType::INTEGRATION,
    Systems::SystemType::SPATIAL_GRID,
    Systems::SystemType::COLLISION,
  };

  const auto& active = currentConfig.activeSystems;
  for (auto type : pipeline) {
    if (std::find(active.begin(), active.end(), type) == active.end()) {
      continue;
    }
    switch (type) {
      case Systems::SystemType::INTEGRATION:
        systems.emplace_back(type, std::make_unique<Systems::IntegrationSystem>());
        break;
      case Systems::SystemType::SPATIAL_GRID:
        systems.emplace_back(type, std::make_unique<Systems::SpatialGridSystem>());
        break;
      case Systems::SystemType::COLLISION:
        systems.emplace_back(type, std::make_unique<Systems::CollisionResolverSystem>());
        break;
    }
  }

  for (auto& [type, system] : systems) {
    system->setSystemConfig(currentConfig);
  }
  renderSync.setSystemConfig(currentConfig);

  RRECT_DEBUG_MSG(RRECT_DEBUG_LEVEL_BASIC,
    "PhysicsSimulator: " << systems.size() << " systems active, cell size "
    << currentConfig.CellSize << "\n");
}

void PhysicsSimulator::tick(double dt) {
  RRECT_PROFILE_SCOPE("PhysicsSimulator::tick");

  PhysicsDebugStats::reset();
  context.collisionEvents.clear();
  context.dt = dt;

  for (auto& [type, system] : systems) {
    system->update(registry, context);
  }

  ++ticks;
  PhysicsDebugStats::printTickStats();
}

void PhysicsSimulator::tick() {
  tick(currentConfig.SecondsPerTick);
}

void PhysicsSimulator::updatePresentation() {
  renderSync.sync(registry);
}

entt::registry& PhysicsSimulator::getRegistry() {
  return registry;
}

const entt::registry& PhysicsSimulator::getRegistry() const {
  return registry;
}

Systems::ISystem* PhysicsSimulator::getSystem(Systems::SystemType type) {
  for (auto& [t, system] : systems) {
    if (t == type) {
      return system.get();
    }
  }
  return nullptr;
}
