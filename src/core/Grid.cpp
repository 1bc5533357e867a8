#include "core/Grid.hpp"

namespace gridmaze
{

Direction Opposite(Direction d)
{
    switch (d)
    {
    case Direction::North: return Direction::South;
    case Direction::East:  return Direction::West;
    case Direction::South: return Direction::North;
    case Direction::West:  return Direction::East;
    }
    return d;
}

std::string ToString(const Cell& c)
{
    return "(" + std::to_string(c.row) + "," + std::to_string(c.column) + ")";
}

std::string ToString(Direction d)
{
    switch (d)
    {
    case Direction::North: return "north";
    case Direction::East:  return "east";
    case Direction::South: return "south";
    case Direction::West:  return "west";
    }
    return "?";
}

Grid::Grid(int32_t rows, int32_t columns)
    : rows_(rows), columns_(columns)
{
    if (rows <= 0 || columns <= 0)
    {
        throw std::invalid_argument(
            "grid dimensions must be positive, got " + std::to_string(rows) + "x" + std::to_string(columns));
    }
}

std::optional<Cell> Grid::Neighbor(const Cell& c, Direction d) const
{
    static const int dr[4] = { -1, 0, 1, 0 };
    static const int dc[4] = { 0, 1, 0, -1 };

    // widened so cells near the int32 limits cannot overflow
    const auto i = static_cast<size_t>(d);
    const int64_t row = static_cast<int64_t>(c.row) + dr[i];
    const int64_t column = static_cast<int64_t>(c.column) + dc[i];
    if (row < 0 || column < 0 || row >= rows_ || column >= columns_)
        return std::nullopt;
    return Cell{ static_cast<int32_t>(row), static_cast<int32_t>(column) };
}

std::vector<Cell> Grid::AllCells() const
{
    std::vector<Cell> cells;
    cells.reserve(Size());
    for (int32_t r = 0; r < rows_; ++r)
    {
        for (int32_t c = 0; c < columns_; ++c)
            cells.push_back({ r, c });
    }
    return cells;
}

} // namespace gridmaze
