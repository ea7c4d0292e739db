/**
 * @file main.cpp
 * @brief lumen-cli entry point
 */

#include "cli.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "lumen-cli - Smart Bulb Control Client\n\n";
    std::cout << "Usage: " << program << " [options] <command> [args]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --server <host:port>   lumend address (default: localhost:50061)\n";
    std::cout << "  --device <ip:port>     Bulb to act on (default: daemon's default bulb)\n";
    std::cout << "  --json                 Output in JSON format\n";
    std::cout << "  --help                 Show this help message\n\n";
    std::cout << "Commands:\n";
    std::cout << "  on | off                       Switch the bulb\n";
    std::cout << "  brightness <0-100>             Set brightness\n";
    std::cout << "  color <#rrggbb> | <r> <g> <b>  Set color\n";
    std::cout << "  status                         Show bulb status\n";
    std::cout << "  statuses                       Show status of every connected bulb\n";
    std::cout << "  ping                           Check the bulb answers\n";
    std::cout << "  discover [timeout-ms]          Find bulbs on the network\n";
    std::cout << "  connect <ip> <port>            Connect a bulb\n";
    std::cout << "  disconnect <ip> <port>         Disconnect a bulb\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program << " discover 3000\n";
    std::cout << "  " << program << " --device 192.168.1.50:4000 color ff8800\n";
    std::cout << "  " << program << " --json statuses\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    lumen::cli::CliConfig config;
    std::vector<std::string> command;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!command.empty()) {
            command.push_back(arg);
        }
        else if (arg == "--server") {
            if (i + 1 >= argc) {
                std::cerr << "Option --server requires a value\n";
                return 1;
            }
            config.server = argv[++i];
        }
        else if (arg == "--device") {
            if (i + 1 >= argc ||
                !lumen::cli::parse_endpoint(argv[i + 1], config.device.address, config.device.port)) {
                std::cerr << "Option --device requires <ip:port>\n";
                return 1;
            }
            ++i;
        }
        else if (arg == "--json") {
            config.json_mode = true;
        }
        else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg[0] != '-') {
            // First non-option argument is the command; the rest are its arguments
            command.push_back(arg);
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return 1;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        lumen::cli::Cli cli(config);
        return cli.run_command(command);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
