#include <iostream>
#include "commands.hh"

int main(int argc, char* argv[]) {
    return pngme::cli::run(argc, argv, std::cout, std::cerr);
}
