#pragma once
#include "core/Common.hpp"
#include "core/Grid.hpp"
#include "core/MazeBuilder.hpp"

#include <iosfwd>
#include <optional>

namespace gridmaze
{

struct AppOptions
{
    int32_t rows{10};
    int32_t columns{10};
    MazeAlgorithm algo{MazeAlgorithm::BinaryTree};
    uint32_t seed{0};
    Cell from{0, 0};
    std::optional<Cell> to{}; // defaults to the bottom-right cell
    int32_t count{1};
    size_t threads{0};
    bool help{false};
};

// Parses --key=value arguments (argv without the program name).
bool ParseOptions(const std::vector<std::string>& args, AppOptions& out, std::string& outError);

std::string Usage();

// Returns the process exit code.
int RunApp(const AppOptions& options, std::ostream& out);

} // namespace gridmaze
