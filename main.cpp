#include <iostream>
#include "cli.hpp"

int main(int argc, char* argv[]) {
    return runCommand(argc, argv, std::cout, std::cerr);
}
