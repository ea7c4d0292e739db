/**
 * @file protocol.hpp
 * @brief Bulb wire protocol: message types and JSON codec.
 *
 * One UDP datagram carries exactly one JSON value, no length prefix.
 *
 *   request   {"command": "<name>", "params": {...}?, "id": "<token>"?}
 *   response  {"success": bool, "data": any?, "error": string?, "id": string?}
 *   discovery {"type": "discovery", "command": "discover"}
 *   reply     {"type": "discovery_response", "data": {"name", "model",
 *              "firmwareVersion", "macAddress"}}
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"
#include "lumen/net/udp_socket.hpp"

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace lumen {
namespace core {

/**
 * @struct RgbColor
 * @brief Colour with 8-bit channels.
 */
struct LUMEN_CORE_API RgbColor {
    int r = 255;
    int g = 255;
    int b = 255;

    bool operator==(const RgbColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const RgbColor& other) const { return !(*this == other); }
};

/**
 * @struct DeviceStatus
 * @brief Last-known state of a bulb.
 *
 * `connected` reports freshness: true after any successful exchange,
 * false once a status query has failed.
 */
struct LUMEN_CORE_API DeviceStatus {
    bool power = false;
    int brightness = 0;                 ///< 0-100
    RgbColor color;
    std::optional<int> temperature;     ///< Colour temperature in Kelvin, if reported
    bool connected = false;

    Json::Value toJson() const;
};

/**
 * @struct Command
 * @brief Outgoing request. `id` is filled in by the correlator.
 */
struct LUMEN_CORE_API Command {
    std::string command;
    Json::Value params;                 ///< nullValue when the command takes no params
    std::string id;

    Command() = default;
    explicit Command(std::string name, Json::Value parameters = Json::Value())
        : command(std::move(name))
        , params(std::move(parameters))
    {}
};

/**
 * @struct Response
 * @brief Decoded device reply.
 */
struct LUMEN_CORE_API Response {
    bool success = false;
    Json::Value data;                   ///< nullValue when absent
    std::optional<std::string> error;
    std::optional<std::string> id;      ///< Absent for unsolicited status pushes
};

/**
 * @struct DiscoveredDevice
 * @brief A bulb that answered a discovery broadcast.
 */
struct LUMEN_CORE_API DiscoveredDevice {
    std::string address;
    uint16_t port = 0;
    std::optional<std::string> name;
    std::optional<std::string> model;
    std::optional<std::string> firmware_version;
    std::optional<std::string> mac_address;

    /// "address:port", the identity of a device within a discovery round
    std::string key() const { return address + ":" + std::to_string(port); }

    Json::Value toJson() const;
};

namespace protocol {

// Command names understood by bulbs
constexpr const char* kSetPower = "set_power";
constexpr const char* kSetBrightness = "set_brightness";
constexpr const char* kSetColor = "set_color";
constexpr const char* kGetStatus = "get_status";
constexpr const char* kPing = "ping";
constexpr const char* kDiscover = "discover";

constexpr const char* kDiscoveryType = "discovery";
constexpr const char* kDiscoveryResponseType = "discovery_response";

/**
 * @brief Serialize a value without whitespace.
 */
LUMEN_CORE_API std::string toCompactJson(const Json::Value& value);

/**
 * @brief Parse a datagram as a single JSON value.
 * @return The value, or std::nullopt if the payload is not valid JSON.
 */
LUMEN_CORE_API std::optional<Json::Value> parseJson(const char* data, std::size_t length);

LUMEN_CORE_API std::string encodeCommand(const Command& command);

/**
 * @brief Decode a device response.
 *
 * The payload must be a JSON object whose "success" member is a boolean;
 * "id" and "error", when present, must be strings.
 * @return The response, or std::nullopt when the datagram is malformed.
 */
LUMEN_CORE_API std::optional<Response> decodeResponse(const char* data, std::size_t length);

LUMEN_CORE_API std::string encodeDiscoveryRequest();

/**
 * @brief Decode a discovery reply received from `sender`.
 * @return The device, or std::nullopt if the datagram is not a discovery reply.
 */
LUMEN_CORE_API std::optional<DiscoveredDevice> decodeDiscoveryResponse(
    const char* data, std::size_t length, const net::SocketAddress& sender);

/**
 * @brief Shallow-merge status fields from a response's data object.
 *
 * Recognised fields overwrite the cached value. Missing, ill-typed or
 * out-of-range fields (brightness outside 0-100, a channel outside 0-255)
 * keep it. A colour replaces the cached colour only when all three
 * channels are valid. Marks the status connected.
 */
LUMEN_CORE_API void mergeStatus(DeviceStatus& status, const Json::Value& data);

}  // namespace protocol
}  // namespace core
}  // namespace lumen
