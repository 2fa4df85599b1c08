#include <iostream>
#include <vector>
#include <string>
#include "cli/base_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

int main(int argc, char** argv) {
    try {
        BaseCLI cli;

        if (argc == 1) {
            cli.print_help();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "gitbridge"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << GITBRIDGE_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            cli.print_help();
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.execute_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
