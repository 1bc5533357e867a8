#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

#include <unordered_map>

namespace gridmaze
{

// Edge count from a source cell. Cells that were not reached are absent.
using DistanceMap = std::unordered_map<Cell, int32_t, CellHash>;

// Cells of one shortest path, each with its distance from the path's start.
using PathMap = std::unordered_map<Cell, int32_t, CellHash>;

struct LongestPath
{
    Cell from{};
    Cell to{};
    int32_t length{0};
    PathMap path{};
};

class PathFinder
{
public:
    // BFS over linked neighbors; the map doubles as the visited set.
    static DistanceMap Distances(const Maze& maze, const Cell& source);

    // Walks back from `to` along strictly decreasing distances.
    // Throws Unreachable when `to` is not connected to `from`.
    static PathMap ShortestPath(const Maze& maze, const Cell& from, const Cell& to);

    // Largest distance; ties go to the first cell in row-major order.
    // Throws std::invalid_argument on an empty map.
    static Cell Farthest(const DistanceMap& distances);

    // Cells of a path sorted by distance, start first.
    static std::vector<Cell> OrderedPath(const PathMap& path);

    // Two BFS passes: from (0,0) to its farthest cell, then from there to the
    // farthest cell again. On a spanning tree this is the maze's diameter.
    static LongestPath FindLongestPath(const Maze& maze);
};

} // namespace gridmaze
