#include <gtest/gtest.h>

#include "core/MazeBuilder.hpp"
#include "core/PathFinder.hpp"

using namespace gridmaze;

namespace
{

// 2x3: every rung plus the bottom rail, a spanning tree.
Maze ladder()
{
    Maze maze = Maze::Build(2, 3);
    maze.Link({1, 0}, {1, 1});
    maze.Link({1, 1}, {1, 2});
    for (int32_t c = 0; c < 3; ++c)
        maze.Link({0, c}, {1, c});
    return maze;
}

// 2x3 with both rails and every rung: contains cycles.
Maze fullLadder()
{
    Maze maze = ladder();
    maze.Link({0, 0}, {0, 1});
    maze.Link({0, 1}, {0, 2});
    return maze;
}

} // namespace

TEST(PathFinderTest, DistancesAlongSnake)
{
    Maze maze = Maze::Build(2, 2);
    maze.Link({0, 0}, {0, 1});
    maze.Link({0, 1}, {1, 1});
    maze.Link({1, 1}, {1, 0});

    const DistanceMap expected = {
        {{0, 0}, 0}, {{0, 1}, 1}, {{1, 1}, 2}, {{1, 0}, 3}
    };
    EXPECT_EQ(PathFinder::Distances(maze, {0, 0}), expected);
}

TEST(PathFinderTest, DisconnectedCellsAreAbsent)
{
    Maze maze = Maze::Build(2, 2);
    maze.Link({0, 0}, {0, 1});

    const DistanceMap d = PathFinder::Distances(maze, {0, 0});
    EXPECT_EQ(d.size(), 2u);
    EXPECT_EQ(d.count({1, 0}), 0u);
    EXPECT_EQ(d.count({1, 1}), 0u);
}

TEST(PathFinderTest, SourceAloneOnUnlinkedMaze)
{
    const Maze maze = Maze::Build(3, 3);
    const DistanceMap d = PathFinder::Distances(maze, {1, 1});
    EXPECT_EQ(d, (DistanceMap{{{1, 1}, 0}}));
}

TEST(PathFinderTest, DistancesOnCycleTakeShorterWay)
{
    const Maze maze = fullLadder();
    const DistanceMap d = PathFinder::Distances(maze, {0, 0});
    EXPECT_EQ(d.at({0, 2}), 2);
    EXPECT_EQ(d.at({1, 2}), 3);
    EXPECT_EQ(d.at({1, 1}), 2);
    EXPECT_EQ(d.at({1, 0}), 1);
}

TEST(PathFinderTest, ShortestPathOnFullLadderGoesDownFirst)
{
    const Maze maze = fullLadder();
    ASSERT_EQ(maze.LinkCount(), 7u);

    const PathMap expected = {
        {{0, 0}, 0}, {{1, 0}, 1}, {{1, 1}, 2}
    };
    EXPECT_EQ(PathFinder::ShortestPath(maze, {0, 0}, {1, 1}), expected);
}

TEST(PathFinderTest, ShortestPathOnLadder)
{
    const Maze maze = ladder();
    const PathMap expected = {
        {{0, 0}, 0}, {{1, 0}, 1}, {{1, 1}, 2}
    };
    EXPECT_EQ(PathFinder::ShortestPath(maze, {0, 0}, {1, 1}), expected);
}

TEST(PathFinderTest, PathToSelfIsSingleEntry)
{
    const Maze maze = ladder();
    EXPECT_EQ(PathFinder::ShortestPath(maze, {0, 2}, {0, 2}), (PathMap{{{0, 2}, 0}}));
}

TEST(PathFinderTest, UnreachableTargetThrows)
{
    Maze maze = Maze::Build(2, 2);
    maze.Link({0, 0}, {0, 1});

    try
    {
        PathFinder::ShortestPath(maze, {0, 0}, {1, 1});
        FAIL() << "expected Unreachable";
    }
    catch (const Unreachable& e)
    {
        EXPECT_EQ(e.from(), (Cell{0, 0}));
        EXPECT_EQ(e.to(), (Cell{1, 1}));
    }
}

TEST(PathFinderTest, DistancesSymmetricOnGeneratedMaze)
{
    std::mt19937 rng(99);
    const Maze maze = MazeBuilder::Build(MazeAlgorithm::Sidewinder, 5, 6, rng);

    const std::vector<Cell> cells = maze.AllCells();
    std::vector<DistanceMap> all;
    for (const Cell& c : cells)
        all.push_back(PathFinder::Distances(maze, c));

    for (size_t i = 0; i < cells.size(); ++i)
    {
        EXPECT_EQ(all[i].size(), cells.size());
        for (size_t j = 0; j < cells.size(); ++j)
            EXPECT_EQ(all[i].at(cells[j]), all[j].at(cells[i]));
    }
}

TEST(PathFinderTest, ShortestPathIsLinkedWalk)
{
    std::mt19937 rng(2024);
    const Maze maze = MazeBuilder::Build(MazeAlgorithm::BinaryTree, 8, 8, rng);

    const Cell from{7, 0};
    const Cell to{0, 7};
    const DistanceMap d = PathFinder::Distances(maze, from);
    const PathMap path = PathFinder::ShortestPath(maze, from, to);
    const std::vector<Cell> ordered = PathFinder::OrderedPath(path);

    ASSERT_FALSE(ordered.empty());
    EXPECT_EQ(ordered.front(), from);
    EXPECT_EQ(ordered.back(), to);
    EXPECT_EQ(path.at(from), 0);
    EXPECT_EQ(path.at(to), d.at(to));
    EXPECT_EQ(static_cast<int32_t>(ordered.size()) - 1, d.at(to));

    for (size_t i = 0; i + 1 < ordered.size(); ++i)
    {
        EXPECT_TRUE(maze.IsLinked(ordered[i], ordered[i + 1]));
        EXPECT_EQ(path.at(ordered[i]) + 1, path.at(ordered[i + 1]));
    }
}

TEST(PathFinderTest, FarthestBreaksTiesRowMajor)
{
    const DistanceMap d = {
        {{0, 0}, 0}, {{1, 2}, 4}, {{0, 3}, 4}, {{2, 0}, 1}
    };
    EXPECT_EQ(PathFinder::Farthest(d), (Cell{0, 3}));
    EXPECT_THROW(PathFinder::Farthest(DistanceMap{}), std::invalid_argument);
}

TEST(PathFinderTest, LongestPathOnCorridor)
{
    Maze maze = Maze::Build(1, 5);
    for (int32_t c = 0; c + 1 < 5; ++c)
        maze.Link({0, c}, {0, c + 1});

    const LongestPath longest = PathFinder::FindLongestPath(maze);
    EXPECT_EQ(longest.from, (Cell{0, 4}));
    EXPECT_EQ(longest.to, (Cell{0, 0}));
    EXPECT_EQ(longest.length, 4);
    EXPECT_EQ(longest.path.size(), 5u);
}

TEST(PathFinderTest, LongestPathIsNoShorterThanAnyPair)
{
    std::mt19937 rng(11);
    const Maze maze = MazeBuilder::Build(MazeAlgorithm::BinaryTree, 6, 7, rng);
    const LongestPath longest = PathFinder::FindLongestPath(maze);

    for (const Cell& c : maze.AllCells())
    {
        for (const auto& [cell, dist] : PathFinder::Distances(maze, c))
            EXPECT_LE(dist, longest.length) << ToString(c) << " -> " << ToString(cell);
    }
}
