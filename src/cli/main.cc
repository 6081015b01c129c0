/**
 * @file main.cc
 * @brief pngme command line tool
 *
 * Hides text messages in PNG files as extra chunks, reads them back,
 * removes them and lists the chunks of a file.
 */

#include <iostream>
#include <string>
#include <vector>

#include "commands.hh"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    pngme::cli::command_runner runner(std::cout, std::cerr);
    return runner.run(args);
}
