/**
 * @file cli.hpp
 * @brief One-shot command runner for lumen-cli
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "control_client.hpp"
#include "output_formatter.hpp"

namespace lumen::cli {

/**
 * @brief CLI configuration
 */
struct CliConfig {
    bool json_mode = false;
    std::string server = "localhost:50061";
    DeviceTarget device;                        // Empty = daemon's default bulb
};

/**
 * @brief Split "host:port"
 * @return false if the port is missing or not in 1-65535
 */
bool parse_endpoint(const std::string& text, std::string& host, uint16_t& port);

/**
 * @brief Main CLI application class
 */
class Cli {
public:
    explicit Cli(CliConfig config = {});
    ~Cli();

    /**
     * @brief Connect to the daemon and execute one command
     * @param args Command name followed by its arguments
     * @return Exit code
     */
    int run_command(const std::vector<std::string>& args);

private:
    CliConfig config_;
    std::unique_ptr<OutputFormatter> output_;
    std::unique_ptr<ControlClient> client_;

    int execute(const std::string& command, const std::vector<std::string>& args);

    void print_status(const BulbStatus& status);
    void print_statuses(const std::vector<BulbStatus>& statuses);
    void print_discovered(const std::vector<DiscoveredBulb>& bulbs);
};

} // namespace lumen::cli
