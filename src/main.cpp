#include "App/App.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    gridmaze::AppOptions options;
    std::string error;
    if (!gridmaze::ParseOptions(args, options, error))
    {
        std::cerr << "gridmaze: " << error << "\n\n" << gridmaze::Usage();
        return 2;
    }

    try
    {
        return gridmaze::RunApp(options, std::cout);
    }
    catch (const std::exception& e)
    {
        std::cerr << "gridmaze: " << e.what() << std::endl;
        return 1;
    }
}
