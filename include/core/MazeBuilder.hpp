#pragma once
#include "core/Common.hpp"
#include "core/Maze.hpp"

namespace gridmaze
{

enum class MazeAlgorithm
{
    BinaryTree,
    Sidewinder
};

// Accepts "binary-tree"/"bt" and "sidewinder"/"sw", any case.
bool ParseAlgorithm(const std::string& s, MazeAlgorithm& out);
std::string ToString(MazeAlgorithm algo);

// Called after every link so callers can watch the maze being carved.
using StepCallback = std::function<void(const Maze&)>;

class MazeBuilder
{
public:
    // Fresh rows x columns maze carved by algo. rng is consumed in row-major order.
    static Maze Build(
        MazeAlgorithm algo,
        int32_t rows,
        int32_t columns,
        std::mt19937& rng,
        const StepCallback& onStep = {}
    );

    // Both take an unlinked maze and return it carved into a spanning tree.
    static Maze BinaryTree(Maze maze, std::mt19937& rng, const StepCallback& onStep = {});
    static Maze Sidewinder(Maze maze, std::mt19937& rng, const StepCallback& onStep = {});
};

} // namespace gridmaze
