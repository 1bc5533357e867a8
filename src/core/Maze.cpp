#include "core/Maze.hpp"

namespace gridmaze
{

Maze::Maze(const Grid& grid)
    : grid_(grid)
{
    cells_.resize(grid_.Size());
    for (size_t i = 0; i < cells_.size(); ++i)
    {
        const Cell c = grid_.CellAt(i);
        for (Direction d : kAllDirections)
        {
            auto n = grid_.Neighbor(c, d);
            if (!n) continue;

            Side& side = cells_[i].sides[static_cast<size_t>(d)];
            side.exists = true;
            side.neighbor = static_cast<uint32_t>(grid_.IndexOf(*n));
        }
    }
}

Maze Maze::Build(int32_t rows, int32_t columns)
{
    return Maze(Grid(rows, columns));
}

std::vector<Cell> Maze::NeighborsOf(const Cell& c, const std::vector<Direction>& directions) const
{
    std::vector<Cell> out;
    out.reserve(directions.size());
    for (Direction d : directions)
    {
        if (auto n = grid_.Neighbor(c, d))
            out.push_back(*n);
    }
    return out;
}

std::optional<Direction> Maze::sideTowards_(const Cell& a, const Cell& b) const
{
    if (!grid_.Contains(a) || !grid_.Contains(b))
        return std::nullopt;

    const auto target = static_cast<uint32_t>(grid_.IndexOf(b));
    const CellRecord& rec = cells_[grid_.IndexOf(a)];
    for (Direction d : kAllDirections)
    {
        const Side& side = rec.sides[static_cast<size_t>(d)];
        if (side.exists && side.neighbor == target)
            return d;
    }
    return std::nullopt;
}

bool Maze::IsLinked(const Cell& a, const Cell& b) const
{
    auto d = sideTowards_(a, b);
    if (!d) return false;
    return cells_[grid_.IndexOf(a)].sides[static_cast<size_t>(*d)].linked;
}

std::vector<Cell> Maze::LinkedNeighbors(const Cell& c) const
{
    std::vector<Cell> out;
    if (!grid_.Contains(c)) return out;

    const CellRecord& rec = cells_[grid_.IndexOf(c)];
    for (Direction d : kAllDirections)
    {
        const Side& side = rec.sides[static_cast<size_t>(d)];
        if (side.exists && side.linked)
            out.push_back(grid_.CellAt(side.neighbor));
    }
    return out;
}

void Maze::Link(const Cell& a, const Cell& b)
{
    auto d = sideTowards_(a, b);
    if (!d)
        throw InvalidLink(a, b);

    Side& forward = cells_[grid_.IndexOf(a)].sides[static_cast<size_t>(*d)];
    Side& backward = cells_[grid_.IndexOf(b)].sides[static_cast<size_t>(Opposite(*d))];
    if (!forward.linked)
        ++linkCount_;
    forward.linked = true;
    backward.linked = true;
}

bool Maze::HasWall(const Cell& c, Direction d) const
{
    if (!grid_.Contains(c)) return true;
    const Side& side = cells_[grid_.IndexOf(c)].sides[static_cast<size_t>(d)];
    return !side.exists || !side.linked;
}

std::vector<Cell> Maze::DeadEnds() const
{
    std::vector<Cell> out;
    for (size_t i = 0; i < cells_.size(); ++i)
    {
        int links = 0;
        for (const Side& side : cells_[i].sides)
        {
            if (side.exists && side.linked) ++links;
        }
        if (links == 1)
            out.push_back(grid_.CellAt(i));
    }
    return out;
}

} // namespace gridmaze
