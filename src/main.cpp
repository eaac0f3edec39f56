#include <iostream>
#include <string>
#include <vector>

#include "rulex/cli.hpp"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return rulex::cli::execute(args, std::cin, std::cout, std::cerr);
}
