/**
 * @file main.cc
 * @brief pngme - hide, reveal and remove messages in PNG chunks
 *
 * Usage: pngme <encode|decode|remove|print> <file> [chunk_type] [message] [output_file]
 */

#include <iostream>

#include "cli.hh"

int main(int argc, char* argv[]) {
    try {
        auto args = pngme::parse_command_line(argc, argv);
        if (!args) {
            pngme::print_usage(std::cout, argv[0]);
            return pngme::exit_usage;
        }
        return pngme::run(*args, std::cout, std::cerr);
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return pngme::exit_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return pngme::exit_usage;
    }
}
