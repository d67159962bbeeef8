/**
 * @file main.cpp
 * @brief ripsim command line entry point
 */

#include <ripsim/app/cli.hpp>
#include <iostream>

int main(int argc, char** argv) {
    return ripsim::run_cli(argc, argv, std::cout, std::cerr);
}
