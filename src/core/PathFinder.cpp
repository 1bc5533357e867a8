#include "core/PathFinder.hpp"

#include <algorithm>

namespace gridmaze
{

DistanceMap PathFinder::Distances(const Maze& maze, const Cell& source)
{
    DistanceMap distances;
    distances[source] = 0;

    std::vector<Cell> frontier{ source };
    std::vector<Cell> next;
    int32_t distance = 0;

    while (!frontier.empty())
    {
        ++distance;
        next.clear();
        for (const Cell& cell : frontier)
        {
            for (const Cell& n : maze.LinkedNeighbors(cell))
            {
                if (distances.count(n)) continue; // first assignment wins

                distances[n] = distance;
                next.push_back(n);
            }
        }
        frontier.swap(next);
    }

    return distances;
}

PathMap PathFinder::ShortestPath(const Maze& maze, const Cell& from, const Cell& to)
{
    const DistanceMap distances = Distances(maze, from);

    auto it = distances.find(to);
    if (it == distances.end())
        throw Unreachable(from, to);

    PathMap path;
    Cell current = to;
    int32_t currentDist = it->second;
    path[current] = currentDist;

    while (current != from)
    {
        // ties only occur on cycles; candidates are tried west, south, east, north
        bool stepped = false;
        const std::vector<Cell> linked = maze.LinkedNeighbors(current);
        for (auto it = linked.rbegin(); it != linked.rend(); ++it)
        {
            const Cell& n = *it;
            auto nd = distances.find(n);
            if (nd == distances.end() || nd->second >= currentDist) continue;

            current = n;
            currentDist = nd->second;
            path[current] = currentDist;
            stepped = true;
            break;
        }

        // BFS labels always leave a strictly closer neighbor for reached cells
        if (!stepped)
            throw Unreachable(from, to);
    }

    return path;
}

Cell PathFinder::Farthest(const DistanceMap& distances)
{
    if (distances.empty())
        throw std::invalid_argument("Farthest: empty distance map");

    auto best = distances.begin();
    for (auto it = distances.begin(); it != distances.end(); ++it)
    {
        if (it->second > best->second || (it->second == best->second && it->first < best->first))
            best = it;
    }
    return best->first;
}

std::vector<Cell> PathFinder::OrderedPath(const PathMap& path)
{
    std::vector<std::pair<int32_t, Cell>> steps;
    steps.reserve(path.size());
    for (const auto& [cell, dist] : path)
        steps.push_back({ dist, cell });

    std::sort(steps.begin(), steps.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    std::vector<Cell> out;
    out.reserve(steps.size());
    for (const auto& s : steps)
        out.push_back(s.second);
    return out;
}

LongestPath PathFinder::FindLongestPath(const Maze& maze)
{
    const Cell origin{ 0, 0 };
    const Cell start = Farthest(Distances(maze, origin));

    const DistanceMap fromStart = Distances(maze, start);
    const Cell goal = Farthest(fromStart);

    LongestPath result;
    result.from = start;
    result.to = goal;
    result.length = fromStart.at(goal);
    result.path = ShortestPath(maze, start, goal);
    return result;
}

} // namespace gridmaze
