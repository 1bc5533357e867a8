#pragma once
#include "core/Common.hpp"
#include "core/Errors.hpp"
#include "core/Grid.hpp"

#include <array>

namespace gridmaze
{

// Link graph over a Grid. One record per cell, indexed row-major; each record
// holds one side per direction. A side without a neighbor is the outer wall.
class Maze
{
public:
    explicit Maze(const Grid& grid);

    // Fresh maze of rows x columns with every link flag false.
    static Maze Build(int32_t rows, int32_t columns);

    const Grid& grid() const { return grid_; }
    int32_t Rows() const { return grid_.Rows(); }
    int32_t Columns() const { return grid_.Columns(); }
    std::vector<Cell> AllCells() const { return grid_.AllCells(); }

    // Keeps the caller's direction order, drops out-of-bounds results.
    std::vector<Cell> NeighborsOf(const Cell& c, const std::vector<Direction>& directions) const;

    // False for non-neighbors and out-of-range cells; never throws.
    bool IsLinked(const Cell& a, const Cell& b) const;

    // Linked neighbors in north, east, south, west order.
    std::vector<Cell> LinkedNeighbors(const Cell& c) const;

    // Throws InvalidLink if b is not a neighbor of a. Sets both sides.
    void Link(const Cell& a, const Cell& b);

    // Outer boundary or an unlinked interior side.
    bool HasWall(const Cell& c, Direction d) const;

    // Undirected links.
    size_t LinkCount() const { return linkCount_; }

    // Cells with exactly one link, row-major.
    std::vector<Cell> DeadEnds() const;

private:
    struct Side
    {
        bool exists{false};
        uint32_t neighbor{0};
        bool linked{false};
    };

    struct CellRecord
    {
        std::array<Side, 4> sides{};
    };

    // Direction from a to b when b is a registered neighbor of a.
    std::optional<Direction> sideTowards_(const Cell& a, const Cell& b) const;

    Grid grid_;
    std::vector<CellRecord> cells_;
    size_t linkCount_{0};
};

} // namespace gridmaze
