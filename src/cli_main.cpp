#include <iostream>
#include "diffx/Cli.hpp"

int main(int argc, char** argv) {
    return diffx::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
