/**
 * @file cli.cpp
 * @brief CLI command implementation
 */

#include "cli.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace lumen::cli {

namespace {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

int parse_int(const std::string& text, const char* what) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
    }
    throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
}

uint16_t parse_port(const std::string& text) {
    int port = parse_int(text, "port");
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("Invalid port: " + text);
    }
    return static_cast<uint16_t>(port);
}

std::string on_off(bool value) {
    return value ? "on" : "off";
}

Json::Value status_to_json(const BulbStatus& status) {
    Json::Value out(Json::objectValue);
    out["bulb"] = status.address + ":" + std::to_string(status.port);
    Json::Value& s = out["status"];
    s["power"] = status.power;
    s["brightness"] = status.brightness;
    s["color"]["r"] = status.r;
    s["color"]["g"] = status.g;
    s["color"]["b"] = status.b;
    if (status.temperature) {
        s["temperature"] = *status.temperature;
    }
    s["connected"] = status.connected;
    return out;
}

void print_usage_error(OutputFormatter& output, const std::string& usage) {
    output.print_error("Usage: " + usage);
}

} // anonymous namespace

bool parse_endpoint(const std::string& text, std::string& host, uint16_t& port) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return false;
    }
    try {
        port = parse_port(text.substr(colon + 1));
    } catch (const std::invalid_argument&) {
        return false;
    }
    host = text.substr(0, colon);
    return true;
}

Cli::Cli(CliConfig config)
    : config_(std::move(config))
    , output_(std::make_unique<OutputFormatter>(config_.json_mode))
    , client_(std::make_unique<ControlClient>())
{
}

Cli::~Cli() = default;

int Cli::run_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        output_->print_error("No command given");
        return 1;
    }

    if (!client_->connect(config_.server)) {
        output_->print_error("Could not connect to lumend at " + config_.server);
        return 1;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        return execute(to_lower(args[0]), rest);
    } catch (const RpcError& e) {
        output_->print_error(e.code() + ": " + e.what());
        return 2;
    } catch (const std::invalid_argument& e) {
        output_->print_error(e.what());
        return 1;
    }
}

int Cli::execute(const std::string& command, const std::vector<std::string>& args) {
    const DeviceTarget& target = config_.device;

    if (command == "on") {
        output_->print_ok(client_->turn_on(target));
    } else if (command == "off") {
        output_->print_ok(client_->turn_off(target));
    } else if (command == "brightness") {
        if (args.size() != 1) {
            print_usage_error(*output_, "brightness <0-100>");
            return 1;
        }
        output_->print_ok(client_->set_brightness(target, parse_int(args[0], "brightness")));
    } else if (command == "color") {
        if (args.size() == 1) {
            output_->print_ok(client_->set_color_hex(target, args[0]));
        } else if (args.size() == 3) {
            output_->print_ok(client_->set_color_rgb(target,
                                                     parse_int(args[0], "red"),
                                                     parse_int(args[1], "green"),
                                                     parse_int(args[2], "blue")));
        } else {
            print_usage_error(*output_, "color <#rrggbb> | color <r> <g> <b>");
            return 1;
        }
    } else if (command == "status") {
        print_status(client_->get_status(target));
    } else if (command == "statuses") {
        print_statuses(client_->get_all_statuses());
    } else if (command == "ping") {
        bool reachable = client_->ping(target);
        if (output_->is_json_mode()) {
            Json::Value out(Json::objectValue);
            out["reachable"] = reachable;
            output_->print_json(out);
        } else {
            std::cout << (reachable ? "PONG" : "(unreachable)") << "\n";
        }
        return reachable ? 0 : 3;
    } else if (command == "discover") {
        int timeout = args.empty() ? 0 : parse_int(args[0], "timeout");
        print_discovered(client_->discover(timeout));
    } else if (command == "connect" || command == "disconnect") {
        if (args.size() != 2) {
            print_usage_error(*output_, command + " <ip> <port>");
            return 1;
        }
        uint16_t port = parse_port(args[1]);
        output_->print_ok(command == "connect"
                          ? client_->connect_device(args[0], port)
                          : client_->disconnect_device(args[0], port));
    } else {
        output_->print_error("Unknown command: " + command);
        return 1;
    }

    return 0;
}

void Cli::print_status(const BulbStatus& status) {
    if (output_->is_json_mode()) {
        output_->print_json(status_to_json(status));
        return;
    }

    std::vector<std::pair<std::string, std::string>> pairs = {
        {"bulb", status.address + ":" + std::to_string(status.port)},
        {"power", on_off(status.power)},
        {"brightness", std::to_string(status.brightness) + "%"},
        {"color", "RGB(" + std::to_string(status.r) + ", " + std::to_string(status.g) +
                  ", " + std::to_string(status.b) + ")"},
    };
    if (status.temperature) {
        pairs.emplace_back("temperature", std::to_string(*status.temperature) + "K");
    }
    pairs.emplace_back("connected", status.connected ? "yes" : "no");
    output_->print_key_values(pairs);
}

void Cli::print_statuses(const std::vector<BulbStatus>& statuses) {
    Json::Value json(Json::objectValue);
    json["bulbs"] = Json::Value(Json::arrayValue);
    std::vector<TableRow> rows;

    for (const auto& status : statuses) {
        json["bulbs"].append(status_to_json(status));
        rows.push_back({{
            status.address + ":" + std::to_string(status.port),
            on_off(status.power),
            std::to_string(status.brightness) + "%",
            "RGB(" + std::to_string(status.r) + ", " + std::to_string(status.g) + ", " +
                std::to_string(status.b) + ")",
            status.connected ? "yes" : "no",
        }});
    }
    json["count"] = static_cast<Json::UInt>(statuses.size());

    output_->print_table({"BULB", "POWER", "BRIGHTNESS", "COLOR", "CONNECTED"}, rows, json);
}

void Cli::print_discovered(const std::vector<DiscoveredBulb>& bulbs) {
    Json::Value json(Json::objectValue);
    json["discovered"] = Json::Value(Json::arrayValue);
    std::vector<TableRow> rows;

    for (const auto& bulb : bulbs) {
        Json::Value entry(Json::objectValue);
        entry["ip"] = bulb.address;
        entry["port"] = bulb.port;
        if (!bulb.name.empty()) entry["name"] = bulb.name;
        if (!bulb.model.empty()) entry["model"] = bulb.model;
        if (!bulb.firmware_version.empty()) entry["firmwareVersion"] = bulb.firmware_version;
        if (!bulb.mac_address.empty()) entry["macAddress"] = bulb.mac_address;
        json["discovered"].append(entry);

        rows.push_back({{
            bulb.address + ":" + std::to_string(bulb.port),
            bulb.name,
            bulb.model,
            bulb.firmware_version,
            bulb.mac_address,
        }});
    }
    json["count"] = static_cast<Json::UInt>(bulbs.size());

    output_->print_table({"ADDRESS", "NAME", "MODEL", "FIRMWARE", "MAC"}, rows, json);
}

} // namespace lumen::cli
