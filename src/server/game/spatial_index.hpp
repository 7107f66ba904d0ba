// SPDX-License-Identifier: Apache-2.0
// spatial_index.hpp - Broad-phase overlap index for circular shapes.
//
// Space is cut into a hashed uniform grid; each shape is filed under the cell of
// its centre. A query around a circle of radius r only visits the cells within
// r + (largest stored radius) of its centre, so with the cell size set to the
// largest entity diameter a query touches the 3x3 neighbourhood.
//
// The index knows nothing about game semantics: it stores Shape values by key.
#pragma once

#include "server/game/types.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arena::game {

class SpatialIndex
{
public:
    using Pair = std::pair<Shape, Shape>;

    explicit SpatialIndex(double cell_size, uint32_t seed = 1);

    // Random position inside bounds where a circle of the given radius overlaps no
    // stored shape. Gives up after `attempts` samples. Does not insert anything.
    std::optional<Vec2> free(const Bounds &bounds, double radius, uint32_t attempts);

    // Stored shapes overlapping `shape`, ordered by key. A stored shape with the
    // same key as the probe is never reported. Does not modify the index.
    std::vector<Shape> test(const Shape &shape) const;

    // Inserts the shape, or replaces the stored geometry for its key.
    void update(const Shape &shape);

    // Deletes the geometry stored under the shape's key; no-op when absent.
    void remove(const Shape &shape);

    // Every overlapping pair exactly once, lower key first, ordered by keys.
    std::vector<Pair> all() const;

    bool contains(ShapeKey key) const { return m_entries.count(key) != 0; }
    std::optional<Shape> get(ShapeKey key) const;
    size_t size() const { return m_entries.size(); }
    void clear();

private:
    using CellKey = uint64_t;

    struct Entry
    {
        Shape shape;
        CellKey cell;
    };

    int32_t cell_coord(double v) const;
    CellKey cell_of(const Vec2 &p) const;

    // Calls fn(const Shape &) for every stored shape filed in a cell within
    // `reach` of centre. No distance filtering.
    template <typename F>
    void for_each_near(const Vec2 &centre, double reach, F &&fn) const;

    double m_cell_size;
    double m_max_radius{0.0};
    std::unordered_map<ShapeKey, Entry> m_entries;
    std::unordered_map<CellKey, std::vector<ShapeKey>> m_cells;
    std::mt19937 m_rng;
};

} // namespace arena::game
