#include <iostream>
#include <string>
#include <vector>

#include "cli.hpp"


int main(int argc, char *argv[])
{
    // Flush after every std::cout / std::cerr

    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    std::vector<std::string> args(argv, argv + argc);
    return metacat::cli::run(args, std::cout, std::cerr);
}
