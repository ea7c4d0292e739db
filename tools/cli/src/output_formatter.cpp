/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include "output_formatter.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace lumen::cli {

OutputFormatter::OutputFormatter(bool json_mode)
    : json_mode_(json_mode) {}

void OutputFormatter::set_json_mode(bool enabled) {
    json_mode_ = enabled;
}

void OutputFormatter::print_ok(const std::string& message) {
    if (json_mode_) {
        Json::Value out(Json::objectValue);
        out["status"] = "OK";
        out["message"] = message;
        print_json(out);
    } else {
        std::cout << "OK: " << message << "\n";
    }
}

void OutputFormatter::print_error(const std::string& message) {
    if (json_mode_) {
        Json::Value out(Json::objectValue);
        out["error"] = message;
        print_json(out);
    } else {
        std::cerr << "(error) " << message << "\n";
    }
}

void OutputFormatter::print_key_values(const std::vector<std::pair<std::string, std::string>>& pairs) {
    if (json_mode_) {
        Json::Value out(Json::objectValue);
        for (const auto& [key, value] : pairs) {
            out[key] = value;
        }
        print_json(out);
        return;
    }

    size_t max_key_len = 0;
    for (const auto& [key, _] : pairs) {
        max_key_len = std::max(max_key_len, key.size());
    }
    for (const auto& [key, value] : pairs) {
        std::cout << std::left << std::setw(static_cast<int>(max_key_len + 1)) << (key + ":")
                  << " " << value << "\n";
    }
}

void OutputFormatter::print_table(const std::vector<std::string>& headers,
                                  const std::vector<TableRow>& rows,
                                  const Json::Value& json) {
    if (json_mode_) {
        print_json(json);
        return;
    }

    if (rows.empty()) {
        std::cout << "(empty list)\n";
        return;
    }

    auto widths = calculate_column_widths(headers, rows);

    // Print header
    for (size_t i = 0; i < headers.size(); ++i) {
        std::cout << std::left << std::setw(static_cast<int>(widths[i] + 2)) << headers[i];
    }
    std::cout << "\n";

    // Print separator
    for (size_t i = 0; i < headers.size(); ++i) {
        std::cout << std::string(widths[i], '-') << "  ";
    }
    std::cout << "\n";

    // Print rows
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.cells.size() && i < widths.size(); ++i) {
            std::cout << std::left << std::setw(static_cast<int>(widths[i] + 2)) << row.cells[i];
        }
        std::cout << "\n";
    }
}

void OutputFormatter::print_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = json_mode_ ? "" : "  ";
    std::cout << Json::writeString(builder, value) << "\n";
}

void OutputFormatter::print_section(const std::string& title) {
    if (!json_mode_) {
        std::cout << "\n# " << title << "\n";
    }
}

std::vector<size_t> OutputFormatter::calculate_column_widths(
    const std::vector<std::string>& headers,
    const std::vector<TableRow>& rows) const {

    std::vector<size_t> widths(headers.size());

    for (size_t i = 0; i < headers.size(); ++i) {
        widths[i] = headers[i].size();
    }

    for (const auto& row : rows) {
        for (size_t i = 0; i < row.cells.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], row.cells[i].size());
        }
    }

    return widths;
}

} // namespace lumen::cli
