/**
 * @file spatial_hash_grid.cpp
 * @brief Implementation of the uniform spatial hash grid
 */

#include "rrect/spatial/spatial_hash_grid.hpp"

#include <cassert>
#include <cmath>

namespace Spatial {

SpatialHashGrid::SpatialHashGrid(double cellSize)
    : cell_size(cellSize)
{
    assert(std::isfinite(cellSize) && cellSize > 0.0 && "Grid cell size must be > 0.");
}

std::vector<GridCell> SpatialHashGrid::coveringCells(const Components::Position& position,
                                                     const Components::Collider& collider) const
{
    Vector const halfSize = collider.size * 0.5;
    Components::Position const minBounds = position - halfSize;
    Components::Position const maxBounds = position + halfSize;

    auto const minX = static_cast<int32_t>(std::floor(minBounds.x / cell_size));
    auto const minY = static_cast<int32_t>(std::floor(minBounds.y / cell_size));
    auto const maxX = static_cast<int32_t>(std::floor(maxBounds.x / cell_size));
    auto const maxY = static_cast<int32_t>(std::floor(maxBounds.y / cell_size));

    std::vector<GridCell> cells;
    cells.reserve(static_cast<std::size_t>(maxX - minX + 1) * static_cast<std::size_t>(maxY - minY + 1));
    for (int32_t x = minX; x <= maxX; ++x) {
        for (int32_t y = minY; y <= maxY; ++y) {
            cells.push_back({x, y});
        }
    }
    return cells;
}

void SpatialHashGrid::insertOrUpdate(entt::entity entity,
                                     const Components::Position& position,
                                     const Components::Collider& collider)
{
    std::vector<GridCell> cells = coveringCells(position, collider);

    auto it = entity_to_cells.find(entity);
    if (it != entity_to_cells.end()) {
        // Cells are generated in a fixed order, so equal sets compare equal
        if (it->second == cells) {
            return;
        }
        unlink(entity, it->second);
    }

    for (const auto& cell : cells) {
        cell_to_entities[cell].insert(entity);
        ++mutations;
    }
    entity_to_cells[entity] = std::move(cells);
}

void SpatialHashGrid::remove(entt::entity entity) {
    auto it = entity_to_cells.find(entity);
    if (it == entity_to_cells.end()) {
        return;
    }
    unlink(entity, it->second);
    entity_to_cells.erase(it);
}

void SpatialHashGrid::unlink(entt::entity entity, const std::vector<GridCell>& cells) {
    for (const auto& cell : cells) {
        auto bucket = cell_to_entities.find(cell);
        if (bucket == cell_to_entities.end()) {
            continue;
        }
        if (bucket->second.erase(entity) > 0) {
            ++mutations;
        }
        if (bucket->second.empty()) {
            cell_to_entities.erase(bucket);
        }
    }
}

std::optional<EntitySet> SpatialHashGrid::neighbors(entt::entity entity) const {
    auto it = entity_to_cells.find(entity);
    if (it == entity_to_cells.end()) {
        return std::nullopt;
    }

    EntitySet found;
    for (const auto& cell : it->second) {
        auto bucket = cell_to_entities.find(cell);
        if (bucket != cell_to_entities.end()) {
            found.insert(bucket->second.begin(), bucket->second.end());
        }
    }
    return found;
}

bool SpatialHashGrid::contains(entt::entity entity) const {
    return entity_to_cells.find(entity) != entity_to_cells.end();
}

std::vector<GridCell> SpatialHashGrid::cellsOf(entt::entity entity) const {
    auto it = entity_to_cells.find(entity);
    if (it == entity_to_cells.end()) {
        return {};
    }
    return it->second;
}

EntitySet SpatialHashGrid::entitiesIn(const GridCell& cell) const {
    auto it = cell_to_entities.find(cell);
    if (it == cell_to_entities.end()) {
        return {};
    }
    return it->second;
}

std::vector<entt::entity> SpatialHashGrid::trackedEntities() const {
    std::vector<entt::entity> entities;
    entities.reserve(entity_to_cells.size());
    for (const auto& [entity, cells] : entity_to_cells) {
        entities.push_back(entity);
    }
    return entities;
}

void SpatialHashGrid::clear() {
    cell_to_entities.clear();
    entity_to_cells.clear();
}

} // namespace Spatial
