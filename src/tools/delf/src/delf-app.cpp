#include "delf/cli/app.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return delf::cli::run(argc, argv, {std::cin, std::cout, std::cerr, delf::cli::processIsElevated()});
}
