/**
 * @file spatial_hash_grid.hpp
 * @brief Uniform-cell broad-phase index for rounded-rectangle colliders
 *
 * Every tracked entity is recorded in each grid cell its bounding box
 * (position +- half the collider size, corner rounding ignored) overlaps.
 * Two maps are kept, cell -> entities and entity -> cells, and they are exact
 * inverses after every public call. Neither map is exposed for writing.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <entt/entt.hpp>

#include "rrect/components/basic.hpp"

namespace Spatial {

/**
 * @brief Integer cell coordinate
 */
struct GridCell {
    int32_t x;
    int32_t y;

    bool operator==(const GridCell& other) const { return x == other.x && y == other.y; }
    bool operator!=(const GridCell& other) const { return !(*this == other); }
};

struct GridCellHash {
    std::size_t operator()(const GridCell& c) const {
        auto const ux = static_cast<uint64_t>(static_cast<uint32_t>(c.x));
        auto const uy = static_cast<uint64_t>(static_cast<uint32_t>(c.y));
        return std::hash<uint64_t>{}((ux << 32) | uy);
    }
};

using EntitySet = std::unordered_set<entt::entity>;

/**
 * @class SpatialHashGrid
 * @brief Incrementally maintained dual index between entities and grid cells
 */
class SpatialHashGrid {
public:
    /**
     * @brief Creates an empty grid
     * @param cellSize Edge length of a cell, must be > 0
     */
    explicit SpatialHashGrid(double cellSize);

    /**
     * @brief Records the cells covered by the entity's current bounds
     *
     * Buckets are only touched when the covered cell set changed since the
     * last call for this entity; a body that stays in the same cells costs no
     * bucket mutation.
     */
    void insertOrUpdate(entt::entity entity,
                        const Components::Position& position,
                        const Components::Collider& collider);

    /**
     * @brief Forgets the entity; no-op if it is not tracked
     */
    void remove(entt::entity entity);

    /**
     * @brief Union of every bucket the entity occupies, itself included
     * @return nullopt if the entity is not tracked
     */
    std::optional<EntitySet> neighbors(entt::entity entity) const;

    /**
     * @brief Cells covered by a bounding box at the given position
     *
     * Cells run from floor(min / cellSize) to floor(max / cellSize) inclusive,
     * x-major.
     */
    std::vector<GridCell> coveringCells(const Components::Position& position,
                                        const Components::Collider& collider) const;

    double cellSize() const { return cell_size; }
    bool contains(entt::entity entity) const;

    /** @brief Recorded cells of the entity, empty if untracked */
    std::vector<GridCell> cellsOf(entt::entity entity) const;

    /** @brief Entities recorded in a cell, empty if none */
    EntitySet entitiesIn(const GridCell& cell) const;

    /** @brief Every tracked entity */
    std::vector<entt::entity> trackedEntities() const;

    std::size_t trackedCount() const { return entity_to_cells.size(); }

    /** @brief Number of non-empty buckets */
    std::size_t bucketCount() const { return cell_to_entities.size(); }

    /** @brief Running count of single bucket insertions and erasures */
    std::size_t mutationCount() const { return mutations; }

    void clear();

private:
    void unlink(entt::entity entity, const std::vector<GridCell>& cells);

    double cell_size;
    std::unordered_map<GridCell, EntitySet, GridCellHash> cell_to_entities;
    std::unordered_map<entt::entity, std::vector<GridCell>> entity_to_cells;
    std::size_t mutations = 0;
};

} // namespace Spatial
