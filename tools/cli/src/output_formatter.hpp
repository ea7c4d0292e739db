/**
 * @file output_formatter.hpp
 * @brief Output formatting for lumen-cli (table and JSON)
 */

#pragma once

#include <json/json.h>

#include <string>
#include <utility>
#include <vector>

namespace lumen::cli {

/**
 * @brief Table row for formatted output
 */
struct TableRow {
    std::vector<std::string> cells;
};

/**
 * @brief Output formatter supporting human-readable and JSON formats
 *
 * In JSON mode every call prints exactly one JSON document on stdout.
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false);

    void set_json_mode(bool enabled);
    bool is_json_mode() const { return json_mode_; }

    // Simple value output
    void print_ok(const std::string& message);
    void print_error(const std::string& message);

    // Key-value output
    void print_key_values(const std::vector<std::pair<std::string, std::string>>& pairs);

    // Table output; `json` is printed instead in JSON mode
    void print_table(const std::vector<std::string>& headers,
                     const std::vector<TableRow>& rows,
                     const Json::Value& json);

    // JSON document output
    void print_json(const Json::Value& value);

    // Section headers (ignored in JSON mode)
    void print_section(const std::string& title);

private:
    bool json_mode_;

    std::vector<size_t> calculate_column_widths(
        const std::vector<std::string>& headers,
        const std::vector<TableRow>& rows) const;
};

} // namespace lumen::cli
