#include "App/App.hpp"
#include "core/PathFinder.hpp"
#include "Thread/ThreadPool.hpp"

#include <charconv>
#include <future>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string_view>

namespace gridmaze
{

static bool parseInt(std::string_view s, int64_t& out)
{
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

static bool parseCell(std::string_view s, Cell& out)
{
    const auto comma = s.find(',');
    if (comma == std::string_view::npos) return false;

    int64_t r = 0, c = 0;
    if (!parseInt(s.substr(0, comma), r) || !parseInt(s.substr(comma + 1), c)) return false;
    if (r < INT32_MIN || r > INT32_MAX || c < INT32_MIN || c > INT32_MAX) return false;

    out = { static_cast<int32_t>(r), static_cast<int32_t>(c) };
    return true;
}

std::string Usage()
{
    return
        "usage: gridmaze [options]\n"
        "  --rows=N          grid rows (default 10)\n"
        "  --columns=N       grid columns (default 10)\n"
        "  --algo=NAME       binary-tree | sidewinder (default binary-tree)\n"
        "  --seed=N          random seed (default 0)\n"
        "  --from=R,C        path start (default 0,0)\n"
        "  --to=R,C          path target (default bottom-right cell)\n"
        "  --count=N         build N mazes and print averages (default 1)\n"
        "  --threads=N       workers for --count, 0 = hardware (default 0)\n"
        "  --help            show this text\n";
}

bool ParseOptions(const std::vector<std::string>& args, AppOptions& out, std::string& outError)
{
    AppOptions opts;

    for (const std::string& arg : args)
    {
        if (arg == "--help" || arg == "-h") { opts.help = true; continue; }

        const auto eq = arg.find('=');
        if (arg.rfind("--", 0) != 0 || eq == std::string::npos)
        {
            outError = "unrecognised argument: " + arg;
            return false;
        }

        const std::string key = arg.substr(2, eq - 2);
        const std::string_view value = std::string_view(arg).substr(eq + 1);
        int64_t n = 0;

        if (key == "rows" || key == "columns")
        {
            if (!parseInt(value, n) || n <= 0 || n > INT32_MAX)
            {
                outError = "--" + key + " must be a positive integer";
                return false;
            }
            (key == "rows" ? opts.rows : opts.columns) = static_cast<int32_t>(n);
        }
        else if (key == "algo")
        {
            if (!ParseAlgorithm(std::string(value), opts.algo))
            {
                outError = "unknown algorithm: " + std::string(value);
                return false;
            }
        }
        else if (key == "seed")
        {
            if (!parseInt(value, n) || n < 0 || n > UINT32_MAX)
            {
                outError = "--seed must be an unsigned 32-bit integer";
                return false;
            }
            opts.seed = static_cast<uint32_t>(n);
        }
        else if (key == "from" || key == "to")
        {
            Cell c;
            if (!parseCell(value, c))
            {
                outError = "--" + key + " expects R,C";
                return false;
            }
            if (key == "from") opts.from = c;
            else opts.to = c;
        }
        else if (key == "count")
        {
            if (!parseInt(value, n) || n <= 0 || n > INT32_MAX)
            {
                outError = "--count must be a positive integer";
                return false;
            }
            opts.count = static_cast<int32_t>(n);
        }
        else if (key == "threads")
        {
            if (!parseInt(value, n) || n < 0 || n > 1024)
            {
                outError = "--threads must be between 0 and 1024";
                return false;
            }
            opts.threads = static_cast<size_t>(n);
        }
        else
        {
            outError = "unknown option: --" + key;
            return false;
        }
    }

    if (static_cast<uint64_t>(opts.seed) + static_cast<uint64_t>(opts.count) - 1 > UINT32_MAX)
    {
        outError = "--seed plus --count runs past the largest 32-bit seed";
        return false;
    }

    // endpoints are checked once the final grid size is known
    const Grid grid(opts.rows, opts.columns);
    if (!grid.Contains(opts.from))
    {
        outError = "--from " + ToString(opts.from) + " is outside the grid";
        return false;
    }
    if (opts.to && !grid.Contains(*opts.to))
    {
        outError = "--to " + ToString(*opts.to) + " is outside the grid";
        return false;
    }

    out = opts;
    return true;
}

struct MazeStats
{
    size_t deadEnds{0};
    int32_t longest{0};
};

static void printPath(std::ostream& out, const std::vector<Cell>& cells)
{
    out << "path:";
    for (const Cell& c : cells) out << ' ' << ToString(c);
    out << '\n';
}

static int runSingle(const AppOptions& opts, std::ostream& out)
{
    std::mt19937 rng(opts.seed);
    const Maze maze = MazeBuilder::Build(opts.algo, opts.rows, opts.columns, rng);
    const Cell to = opts.to.value_or(Cell{ opts.rows - 1, opts.columns - 1 });

    out << "maze " << opts.rows << "x" << opts.columns << " " << ToString(opts.algo)
        << " seed=" << opts.seed << '\n';
    out << "links: " << maze.LinkCount() << '\n';
    out << "dead ends: " << maze.DeadEnds().size() << '\n';

    const PathMap path = PathFinder::ShortestPath(maze, opts.from, to);
    out << "distance " << ToString(opts.from) << " -> " << ToString(to) << ": " << path.at(to) << '\n';
    printPath(out, PathFinder::OrderedPath(path));

    const LongestPath longest = PathFinder::FindLongestPath(maze);
    out << "longest path: " << ToString(longest.from) << " -> " << ToString(longest.to)
        << ", length " << longest.length << '\n';
    return 0;
}

static int runBatch(const AppOptions& opts, std::ostream& out)
{
    ThreadPool pool(opts.threads);

    std::vector<std::future<MazeStats>> results;
    results.reserve(static_cast<size_t>(opts.count));
    for (int32_t i = 0; i < opts.count; ++i)
    {
        const uint32_t seed = opts.seed + static_cast<uint32_t>(i);
        results.push_back(pool.enqueue([opts, seed]() {
            std::mt19937 rng(seed);
            const Maze maze = MazeBuilder::Build(opts.algo, opts.rows, opts.columns, rng);

            MazeStats stats;
            stats.deadEnds = maze.DeadEnds().size();
            stats.longest = PathFinder::FindLongestPath(maze).length;
            return stats;
        }));
    }

    // collected in seed order, independent of scheduling
    double deadEnds = 0.0;
    double longest = 0.0;
    for (auto& f : results)
    {
        const MazeStats s = f.get();
        deadEnds += static_cast<double>(s.deadEnds);
        longest += static_cast<double>(s.longest);
    }

    const double n = static_cast<double>(opts.count);
    out << "mazes: " << opts.count << " " << opts.rows << "x" << opts.columns << " "
        << ToString(opts.algo) << " seeds " << opts.seed << ".." << (opts.seed + static_cast<uint32_t>(opts.count - 1))
        << " on " << pool.size() << " threads\n";
    out << std::fixed << std::setprecision(2);
    out << "average dead ends: " << deadEnds / n << '\n';
    out << "average longest path: " << longest / n << '\n';
    return 0;
}

int RunApp(const AppOptions& options, std::ostream& out)
{
    if (options.help)
    {
        out << Usage();
        return 0;
    }
    return options.count > 1 ? runBatch(options, out) : runSingle(options, out);
}

} // namespace gridmaze
