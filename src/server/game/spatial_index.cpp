// SPDX-License-Identifier: Apache-2.0
#include "server/game/spatial_index.hpp"

#include <algorithm>
#include <cmath>

namespace arena::game {

namespace {

// Keeps cell coordinates inside int32 for any finite or non-finite position.
constexpr double kCoordLimit = 1 << 30;

bool key_less(const Shape &a, const Shape &b)
{
    return a.key() < b.key();
}

} // namespace

SpatialIndex::SpatialIndex(double cell_size, uint32_t seed)
    : m_cell_size(cell_size > 0.0 ? cell_size : 1.0), m_rng(seed)
{}

int32_t SpatialIndex::cell_coord(double v) const
{
    double c = std::floor(v / m_cell_size);
    if (!(c > -kCoordLimit))
        return static_cast<int32_t>(-kCoordLimit);
    if (c > kCoordLimit)
        return static_cast<int32_t>(kCoordLimit);
    return static_cast<int32_t>(c);
}

SpatialIndex::CellKey SpatialIndex::cell_of(const Vec2 &p) const
{
    auto cx = static_cast<uint32_t>(cell_coord(p.x));
    auto cy = static_cast<uint32_t>(cell_coord(p.y));
    return (static_cast<uint64_t>(cx) << 32) | cy;
}

template <typename F>
void SpatialIndex::for_each_near(const Vec2 &centre, double reach, F &&fn) const
{
    int32_t x0 = cell_coord(centre.x - reach);
    int32_t x1 = cell_coord(centre.x + reach);
    int32_t y0 = cell_coord(centre.y - reach);
    int32_t y1 = cell_coord(centre.y + reach);
    for (int32_t cx = x0; cx <= x1; ++cx) {
        for (int32_t cy = y0; cy <= y1; ++cy) {
            CellKey ck = (static_cast<uint64_t>(static_cast<uint32_t>(cx)) << 32) | static_cast<uint32_t>(cy);
            auto it = m_cells.find(ck);
            if (it == m_cells.end())
                continue;
            for (ShapeKey k : it->second)
                fn(m_entries.at(k).shape);
        }
    }
}

std::optional<Vec2> SpatialIndex::free(const Bounds &bounds, double radius, uint32_t attempts)
{
    std::uniform_real_distribution<double> ux(bounds.min.x, bounds.max.x);
    std::uniform_real_distribution<double> uy(bounds.min.y, bounds.max.y);
    Shape probe{};
    probe.radius = radius;
    for (uint32_t i = 0; i < attempts; ++i) {
        probe.pos = {ux(m_rng), uy(m_rng)};
        bool clear = true;
        for_each_near(
            probe.pos,
            radius + m_max_radius,
            [&](const Shape &s)
            {
                if (clear && overlaps(probe, s))
                    clear = false;
            });
        if (clear)
            return probe.pos;
    }
    return std::nullopt;
}

std::vector<Shape> SpatialIndex::test(const Shape &shape) const
{
    std::vector<Shape> hits;
    ShapeKey self = shape.key();
    for_each_near(
        shape.pos,
        shape.radius + m_max_radius,
        [&](const Shape &s)
        {
            if (s.key() != self && overlaps(shape, s))
                hits.push_back(s);
        });
    std::sort(hits.begin(), hits.end(), key_less);
    return hits;
}

void SpatialIndex::update(const Shape &shape)
{
    ShapeKey key = shape.key();
    CellKey cell = cell_of(shape.pos);
    m_max_radius = std::max(m_max_radius, shape.radius);
    auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        m_entries.emplace(key, Entry{shape, cell});
        m_cells[cell].push_back(key);
        return;
    }
    Entry &e = it->second;
    if (e.cell != cell) {
        auto &old_bucket = m_cells[e.cell];
        auto pos = std::find(old_bucket.begin(), old_bucket.end(), key);
        if (pos != old_bucket.end())
            old_bucket.erase(pos);
        if (old_bucket.empty())
            m_cells.erase(e.cell);
        m_cells[cell].push_back(key);
        e.cell = cell;
    }
    e.shape = shape;
}

void SpatialIndex::remove(const Shape &shape)
{
    auto it = m_entries.find(shape.key());
    if (it == m_entries.end())
        return;
    auto bucket_it = m_cells.find(it->second.cell);
    if (bucket_it != m_cells.end()) {
        auto &bucket = bucket_it->second;
        auto pos = std::find(bucket.begin(), bucket.end(), it->first);
        if (pos != bucket.end()) {
            *pos = bucket.back();
            bucket.pop_back();
        }
        if (bucket.empty())
            m_cells.erase(bucket_it);
    }
    m_entries.erase(it);
}

std::vector<SpatialIndex::Pair> SpatialIndex::all() const
{
    std::vector<Pair> pairs;
    for (const auto &[key, entry] : m_entries) {
        const Shape &a = entry.shape;
        for_each_near(
            a.pos,
            a.radius + m_max_radius,
            [&](const Shape &b)
            {
                if (b.key() > key && overlaps(a, b))
                    pairs.emplace_back(a, b);
            });
    }
    std::sort(
        pairs.begin(),
        pairs.end(),
        [](const Pair &l, const Pair &r)
        {
            if (l.first.key() != r.first.key())
                return l.first.key() < r.first.key();
            return l.second.key() < r.second.key();
        });
    return pairs;
}

std::optional<Shape> SpatialIndex::get(ShapeKey key) const
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return std::nullopt;
    return it->second.shape;
}

void SpatialIndex::clear()
{
    m_entries.clear();
    m_cells.clear();
    m_max_radius = 0.0;
}

} // namespace arena::game
