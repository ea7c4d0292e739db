/**
 * @file test_protocol.cpp
 * @brief Unit tests for the bulb wire protocol codec
 */

#include <gtest/gtest.h>
#include <lumen/core/protocol.hpp>

#include <string>

using namespace lumen::core;
using namespace lumen::core::protocol;

namespace {

std::optional<Response> decode(const std::string& text) {
    return decodeResponse(text.data(), text.size());
}

std::optional<DiscoveredDevice> decodeDiscovery(const std::string& text) {
    return decodeDiscoveryResponse(text.data(), text.size(),
                                   lumen::net::SocketAddress("192.168.1.45", 4000));
}

}  // namespace

// =============================================================================
// Requests
// =============================================================================

TEST(ProtocolTest, EncodeCommandWithParamsAndId) {
    Json::Value params(Json::objectValue);
    params["brightness"] = 75;

    Command command(kSetBrightness, params);
    command.id = "abc123xyz";

    std::string text = encodeCommand(command);
    auto parsed = parseJson(text.data(), text.size());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["command"].asString(), "set_brightness");
    EXPECT_EQ((*parsed)["params"]["brightness"].asInt(), 75);
    EXPECT_EQ((*parsed)["id"].asString(), "abc123xyz");
}

TEST(ProtocolTest, EncodeCommandOmitsEmptyFields) {
    std::string text = encodeCommand(Command(kPing));
    EXPECT_EQ(text, "{\"command\":\"ping\"}");
}

TEST(ProtocolTest, EncodeDiscoveryRequest) {
    auto text = encodeDiscoveryRequest();
    auto parsed = parseJson(text.data(), text.size());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["type"].asString(), "discovery");
    EXPECT_EQ((*parsed)["command"].asString(), "discover");
}

// =============================================================================
// Responses
// =============================================================================

TEST(ProtocolTest, DecodeSuccessfulResponse) {
    auto response = decode(R"({"success":true,"data":{"pong":true},"id":"k3j5h7g9a"})");
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response->success);
    EXPECT_TRUE(response->data["pong"].asBool());
    ASSERT_TRUE(response->id.has_value());
    EXPECT_EQ(*response->id, "k3j5h7g9a");
    EXPECT_FALSE(response->error.has_value());
}

TEST(ProtocolTest, DecodeFailedResponse) {
    auto response = decode(R"({"success":false,"error":"Unknown command: reboot","id":"x"})");
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->success);
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(*response->error, "Unknown command: reboot");
    EXPECT_TRUE(response->data.isNull());
}

TEST(ProtocolTest, DecodeResponseWithoutId) {
    auto response = decode(R"({"success":true,"data":{"power":true}})");
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->id.has_value());
}

TEST(ProtocolTest, MalformedResponsesRejected) {
    EXPECT_FALSE(decode("").has_value());
    EXPECT_FALSE(decode("not json").has_value());
    EXPECT_FALSE(decode("{\"success\":true").has_value());
    EXPECT_FALSE(decode("[1,2,3]").has_value());
    EXPECT_FALSE(decode(R"({"data":{}})").has_value());
    EXPECT_FALSE(decode(R"({"success":"yes"})").has_value());
    EXPECT_FALSE(decode(R"({"success":true,"id":42})").has_value());
    EXPECT_FALSE(decode(R"({"success":false,"error":{"code":1}})").has_value());
    EXPECT_FALSE(decode(R"({"success":true} {"success":true})").has_value());
}

// =============================================================================
// Discovery
// =============================================================================

TEST(ProtocolTest, DecodeDiscoveryResponse) {
    auto device = decodeDiscovery(
        R"({"type":"discovery_response","data":{"name":"Kitchen","model":"SB-100",)"
        R"("firmwareVersion":"1.0.0","macAddress":"AA:BB:CC:DD:EE:FF"}})");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->address, "192.168.1.45");
    EXPECT_EQ(device->port, 4000);
    EXPECT_EQ(device->key(), "192.168.1.45:4000");
    EXPECT_EQ(device->name.value_or(""), "Kitchen");
    EXPECT_EQ(device->model.value_or(""), "SB-100");
    EXPECT_EQ(device->firmware_version.value_or(""), "1.0.0");
    EXPECT_EQ(device->mac_address.value_or(""), "AA:BB:CC:DD:EE:FF");
}

TEST(ProtocolTest, DiscoveryResponseWithoutDataKeepsAddress) {
    auto device = decodeDiscovery(R"({"type":"discovery_response"})");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->address, "192.168.1.45");
    EXPECT_FALSE(device->name.has_value());

    Json::Value json = device->toJson();
    EXPECT_EQ(json["ip"].asString(), "192.168.1.45");
    EXPECT_EQ(json["port"].asInt(), 4000);
    EXPECT_FALSE(json.isMember("name"));
}

TEST(ProtocolTest, NonDiscoveryDatagramsIgnored) {
    EXPECT_FALSE(decodeDiscovery(R"({"success":true,"data":{"pong":true}})").has_value());
    EXPECT_FALSE(decodeDiscovery(R"({"type":"discovery","command":"discover"})").has_value());
    EXPECT_FALSE(decodeDiscovery("garbage").has_value());
}

// =============================================================================
// Status merge
// =============================================================================

TEST(ProtocolTest, MergeStatusOverwritesKnownFields) {
    DeviceStatus status;
    Json::Value data(Json::objectValue);
    data["power"] = true;
    data["brightness"] = 80;
    data["color"]["r"] = 10;
    data["color"]["g"] = 20;
    data["color"]["b"] = 30;
    data["temperature"] = 2700;

    mergeStatus(status, data);

    EXPECT_TRUE(status.power);
    EXPECT_EQ(status.brightness, 80);
    EXPECT_EQ(status.color, (RgbColor{10, 20, 30}));
    EXPECT_EQ(status.temperature.value_or(0), 2700);
    EXPECT_TRUE(status.connected);
}

TEST(ProtocolTest, MergeStatusKeepsMissingAndIllTypedFields) {
    DeviceStatus status;
    status.power = true;
    status.brightness = 40;
    status.color = RgbColor{1, 2, 3};

    Json::Value data(Json::objectValue);
    data["brightness"] = "bright";
    data["color"]["r"] = 200;   // incomplete colour

    mergeStatus(status, data);

    EXPECT_TRUE(status.power);
    EXPECT_EQ(status.brightness, 40);
    EXPECT_EQ(status.color, (RgbColor{1, 2, 3}));
    EXPECT_FALSE(status.temperature.has_value());
    EXPECT_TRUE(status.connected);

    Json::Value outOfRange(Json::objectValue);
    outOfRange["brightness"] = 500;
    outOfRange["color"]["r"] = -3;
    outOfRange["color"]["g"] = 10;
    outOfRange["color"]["b"] = 10;

    mergeStatus(status, outOfRange);

    EXPECT_EQ(status.brightness, 40);
    EXPECT_EQ(status.color, (RgbColor{1, 2, 3}));

    Json::Value channelTooHigh(Json::objectValue);
    channelTooHigh["brightness"] = -1;
    channelTooHigh["color"]["r"] = 0;
    channelTooHigh["color"]["g"] = 0;
    channelTooHigh["color"]["b"] = 256;

    mergeStatus(status, channelTooHigh);

    EXPECT_EQ(status.brightness, 40);
    EXPECT_EQ(status.color, (RgbColor{1, 2, 3}));
}

TEST(ProtocolTest, MergeStatusAcceptsRangeBoundaries) {
    DeviceStatus status;
    Json::Value data(Json::objectValue);
    data["brightness"] = 100;
    data["color"]["r"] = 0;
    data["color"]["g"] = 255;
    data["color"]["b"] = 0;

    mergeStatus(status, data);

    EXPECT_EQ(status.brightness, 100);
    EXPECT_EQ(status.color, (RgbColor{0, 255, 0}));
}

TEST(ProtocolTest, StatusToJson) {
    DeviceStatus status;
    status.power = true;
    status.brightness = 55;
    status.color = RgbColor{255, 0, 0};
    status.connected = true;

    Json::Value json = status.toJson();
    EXPECT_TRUE(json["power"].asBool());
    EXPECT_EQ(json["brightness"].asInt(), 55);
    EXPECT_EQ(json["color"]["r"].asInt(), 255);
    EXPECT_EQ(json["color"]["g"].asInt(), 0);
    EXPECT_FALSE(json.isMember("temperature"));
    EXPECT_TRUE(json["connected"].asBool());
}
