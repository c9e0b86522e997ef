/**
 * @file cli_main.cpp
 * @brief jmutate command-line entry point
 *
 * Usage:
 *   jmutate apply --rules rules.json < in.json > out.json
 *   jmutate validate --rules rules.toml
 *   jmutate resolve '$..code' -i in.json
 */

#include "jmutate/Cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return jmutate::run_cli(argc, argv, std::cin, std::cout, std::cerr);
}
