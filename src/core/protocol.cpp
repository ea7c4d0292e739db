/**
 * @file protocol.cpp
 * @brief JSON codec for the bulb wire protocol.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/protocol.hpp"

#include <memory>

namespace lumen {
namespace core {

namespace {

std::optional<std::string> optionalString(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isString()) {
        return value.asString();
    }
    return std::nullopt;
}

bool intInRange(const Json::Value& value, int low, int high) {
    return value.isInt() && value.asInt() >= low && value.asInt() <= high;
}

}  // namespace

Json::Value DeviceStatus::toJson() const {
    Json::Value out(Json::objectValue);
    out["power"] = power;
    out["brightness"] = brightness;
    out["color"]["r"] = color.r;
    out["color"]["g"] = color.g;
    out["color"]["b"] = color.b;
    if (temperature) {
        out["temperature"] = *temperature;
    }
    out["connected"] = connected;
    return out;
}

Json::Value DiscoveredDevice::toJson() const {
    Json::Value out(Json::objectValue);
    out["ip"] = address;
    out["port"] = port;
    if (name) out["name"] = *name;
    if (model) out["model"] = *model;
    if (firmware_version) out["firmwareVersion"] = *firmware_version;
    if (mac_address) out["macAddress"] = *mac_address;
    return out;
}

namespace protocol {

std::string toCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::optional<Json::Value> parseJson(const char* data, std::size_t length) {
    if (data == nullptr || length == 0) {
        return std::nullopt;
    }

    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(data, data + length, &root, &errors)) {
        return std::nullopt;
    }
    return root;
}

std::string encodeCommand(const Command& command) {
    Json::Value root(Json::objectValue);
    root["command"] = command.command;
    if (!command.params.isNull()) {
        root["params"] = command.params;
    }
    if (!command.id.empty()) {
        root["id"] = command.id;
    }
    return toCompactJson(root);
}

std::optional<Response> decodeResponse(const char* data, std::size_t length) {
    auto parsed = parseJson(data, length);
    if (!parsed || !parsed->isObject()) {
        return std::nullopt;
    }
    const Json::Value& root = *parsed;

    const Json::Value& success = root["success"];
    if (!success.isBool()) {
        return std::nullopt;
    }

    Response response;
    response.success = success.asBool();

    if (root.isMember("id")) {
        if (!root["id"].isString()) {
            return std::nullopt;
        }
        response.id = root["id"].asString();
    }

    if (root.isMember("error")) {
        if (!root["error"].isString()) {
            return std::nullopt;
        }
        response.error = root["error"].asString();
    }

    if (root.isMember("data")) {
        response.data = root["data"];
    }

    return response;
}

std::string encodeDiscoveryRequest() {
    Json::Value root(Json::objectValue);
    root["type"] = kDiscoveryType;
    root["command"] = kDiscover;
    return toCompactJson(root);
}

std::optional<DiscoveredDevice> decodeDiscoveryResponse(
    const char* data, std::size_t length, const net::SocketAddress& sender) {
    auto parsed = parseJson(data, length);
    if (!parsed || !parsed->isObject()) {
        return std::nullopt;
    }
    const Json::Value& root = *parsed;

    const Json::Value& type = root["type"];
    if (!type.isString() || type.asString() != kDiscoveryResponseType) {
        return std::nullopt;
    }

    DiscoveredDevice device;
    device.address = sender.ip;
    device.port = sender.port;

    const Json::Value& info = root["data"];
    if (info.isObject()) {
        device.name = optionalString(info, "name");
        device.model = optionalString(info, "model");
        device.firmware_version = optionalString(info, "firmwareVersion");
        device.mac_address = optionalString(info, "macAddress");
    }

    return device;
}

void mergeStatus(DeviceStatus& status, const Json::Value& data) {
    if (data.isObject()) {
        if (data["power"].isBool()) {
            status.power = data["power"].asBool();
        }
        if (intInRange(data["brightness"], 0, 100)) {
            status.brightness = data["brightness"].asInt();
        }

        const Json::Value& color = data["color"];
        if (color.isObject() && intInRange(color["r"], 0, 255) &&
            intInRange(color["g"], 0, 255) && intInRange(color["b"], 0, 255)) {
            status.color = RgbColor{color["r"].asInt(), color["g"].asInt(), color["b"].asInt()};
        }

        if (data["temperature"].isInt()) {
            status.temperature = data["temperature"].asInt();
        }
    }

    status.connected = true;
}

}  // namespace protocol
}  // namespace core
}  // namespace lumen
