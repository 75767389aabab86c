#include <iostream>
#include <vector>
#include <string>
#include "cli/sshgate_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <ssh/system_ssh.hpp>

void print_usage() {
    std::cout << theme::banner(SSHGATE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    sshgate test "
              << theme::color::RESET << theme::color::BROWN << "<user@host[:port]>..."
              << theme::color::RESET << theme::color::DIM
              << "   Diagnose and resolve credentials" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshgate test --all"
              << theme::color::RESET << theme::color::DIM
              << "                     Every host in config.yaml" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    sshgate methods "
              << theme::color::RESET << theme::color::BROWN << "<user@host[:port]>"
              << theme::color::RESET << theme::color::DIM
              << "   List the server's auth methods" << theme::color::RESET << "\n";
    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    -i <key>              Try this identity file first\n"
              << "    --non-interactive     Never prompt (implied when stdin is not a terminal)\n"
              << "    --max-attempts <n>    Outer diagnose passes per target\n"
              << "    -q                    Hide probe progress"
              << theme::color::RESET << "\n\n";
    std::cout << theme::color::DIM
              << "    sshgate --version     Show version\n"
              << "    sshgate --help        Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    // ssh runs us as its askpass helper during password attempts.
    if (is_askpass_invocation()) {
        return run_askpass(argc > 1 ? argv[1] : "");
    }

    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BLUE << theme::color::BOLD << "sshgate"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SSHGATE_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "-h") {
            print_usage();
            return 0;
        }

        auto config = Config::load_global();
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }
        SshgateCLI cli(config.value);

        if (cmd == "test") {
            return cli.run_test(args);
        } else if (cmd == "methods") {
            return cli.run_methods(args);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
