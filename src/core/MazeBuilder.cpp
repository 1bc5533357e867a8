#include "core/MazeBuilder.hpp"

#include <algorithm>
#include <cctype>

namespace gridmaze
{

bool ParseAlgorithm(const std::string& s, MazeAlgorithm& out)
{
    std::string t;
    t.reserve(s.size());
    for (unsigned char ch : s) t.push_back((char)std::tolower(ch));

    if (t == "binary-tree" || t == "binarytree" || t == "bt") { out = MazeAlgorithm::BinaryTree; return true; }
    if (t == "sidewinder" || t == "sw") { out = MazeAlgorithm::Sidewinder; return true; }
    return false;
}

std::string ToString(MazeAlgorithm algo)
{
    switch (algo)
    {
    case MazeAlgorithm::BinaryTree: return "binary-tree";
    case MazeAlgorithm::Sidewinder: return "sidewinder";
    }
    return "?";
}

static size_t pickIndex(std::mt19937& rng, size_t n)
{
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(rng);
}

static void linkAndNotify(Maze& maze, const Cell& a, const Cell& b, const StepCallback& onStep)
{
    maze.Link(a, b);
    if (onStep) onStep(maze);
}

Maze MazeBuilder::Build(
    MazeAlgorithm algo,
    int32_t rows,
    int32_t columns,
    std::mt19937& rng,
    const StepCallback& onStep)
{
    Maze maze = Maze::Build(rows, columns);
    switch (algo)
    {
    case MazeAlgorithm::BinaryTree: return BinaryTree(std::move(maze), rng, onStep);
    case MazeAlgorithm::Sidewinder: return Sidewinder(std::move(maze), rng, onStep);
    }
    return maze;
}

Maze MazeBuilder::BinaryTree(Maze maze, std::mt19937& rng, const StepCallback& onStep)
{
    const std::vector<Direction> northEast = { Direction::North, Direction::East };

    for (const Cell& cell : maze.AllCells())
    {
        const std::vector<Cell> candidates = maze.NeighborsOf(cell, northEast);
        if (candidates.empty()) continue; // north-east corner

        linkAndNotify(maze, cell, candidates[pickIndex(rng, candidates.size())], onStep);
    }
    return maze;
}

Maze MazeBuilder::Sidewinder(Maze maze, std::mt19937& rng, const StepCallback& onStep)
{
    const int32_t rows = maze.Rows();
    const int32_t columns = maze.Columns();

    // top row has no north neighbor: one straight corridor
    for (int32_t c = 0; c + 1 < columns; ++c)
        linkAndNotify(maze, { 0, c }, { 0, c + 1 }, onStep);

    std::uniform_int_distribution<int> coin(0, 1);
    std::vector<Cell> run;
    run.reserve(static_cast<size_t>(columns));

    for (int32_t r = 1; r < rows; ++r)
    {
        run.clear();
        for (int32_t c = 0; c < columns; ++c)
        {
            const Cell cell{ r, c };
            run.push_back(cell);

            const bool atEastEdge = (c + 1 == columns);
            const bool closeRun = atEastEdge || coin(rng) == 0;

            if (closeRun)
            {
                const Cell member = run[pickIndex(rng, run.size())];
                linkAndNotify(maze, member, { member.row - 1, member.column }, onStep);
                run.clear();
            }
            else
            {
                linkAndNotify(maze, cell, { r, c + 1 }, onStep);
            }
        }
    }
    return maze;
}

} // namespace gridmaze
