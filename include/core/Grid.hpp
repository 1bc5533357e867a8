#pragma once
#include "core/Common.hpp"

#include <array>
#include <optional>

namespace gridmaze
{

struct Cell
{
    int32_t row{};
    int32_t column{};

    bool operator==(const Cell& other) const
    {
        return row == other.row && column == other.column;
    }

    bool operator!=(const Cell& other) const
    {
        return !(*this == other);
    }

    bool operator<(const Cell& other) const
    {
        return row != other.row ? row < other.row : column < other.column;
    }
};

struct CellHash
{
    size_t operator()(const Cell& c) const noexcept
    {
        const uint64_t key = (static_cast<uint64_t>(static_cast<uint32_t>(c.row)) << 32) | static_cast<uint32_t>(c.column);
        return std::hash<uint64_t>()(key);
    }
};

// north = row-1, south = row+1, east = column+1, west = column-1
enum class Direction : uint8_t
{
    North = 0,
    East = 1,
    South = 2,
    West = 3
};

constexpr std::array<Direction, 4> kAllDirections = {
    Direction::North, Direction::East, Direction::South, Direction::West
};

Direction Opposite(Direction d);
std::string ToString(const Cell& c);
std::string ToString(Direction d);

class Grid
{
public:
    Grid(int32_t rows, int32_t columns);

    int32_t Rows() const { return rows_; }
    int32_t Columns() const { return columns_; }
    size_t Size() const { return static_cast<size_t>(rows_) * static_cast<size_t>(columns_); }

    bool Contains(const Cell& c) const
    {
        return c.row >= 0 && c.column >= 0 && c.row < rows_ && c.column < columns_;
    }

    // Adjacent cell along d, or nullopt when it falls outside the grid.
    std::optional<Cell> Neighbor(const Cell& c, Direction d) const;

    // Row-major: row ascending, then column ascending.
    std::vector<Cell> AllCells() const;

    size_t IndexOf(const Cell& c) const
    {
        return static_cast<size_t>(c.row) * static_cast<size_t>(columns_) + static_cast<size_t>(c.column);
    }

    Cell CellAt(size_t index) const
    {
        return { static_cast<int32_t>(index / columns_), static_cast<int32_t>(index % columns_) };
    }

private:
    int32_t rows_;
    int32_t columns_;
};

} // namespace gridmaze
