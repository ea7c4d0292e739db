/**
 * @file test_device_proxy.cpp
 * @brief Unit tests for DeviceProxy against the mock bulb
 */

#include <gtest/gtest.h>
#include <lumen/core/device_proxy.hpp>
#include <lumen/core/errors.hpp>

#include "mock_bulb.hpp"

#include <atomic>
#include <future>
#include <string>

using namespace lumen::core;
using lumen::mock::MockBulb;

class DeviceProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(bulb_.start());
    }

    DeviceConfig configFor(int timeoutMs = 2000) const {
        DeviceConfig config;
        config.address = "127.0.0.1";
        config.port = bulb_.port();
        config.timeout_ms = timeoutMs;
        return config;
    }

    MockBulb bulb_{0, "Test Bulb", "127.0.0.1"};
};

// =============================================================================
// Commands
// =============================================================================

TEST_F(DeviceProxyTest, PowerOnAndOff) {
    DeviceProxy proxy(configFor());

    proxy.turnOn();
    EXPECT_TRUE(bulb_.state().power);
    EXPECT_TRUE(proxy.lastStatus().power);

    proxy.turnOff();
    EXPECT_FALSE(bulb_.state().power);
    EXPECT_FALSE(proxy.lastStatus().power);
}

TEST_F(DeviceProxyTest, SetBrightness) {
    DeviceProxy proxy(configFor());

    proxy.setBrightness(0);
    EXPECT_EQ(bulb_.state().brightness, 0);

    proxy.setBrightness(100);
    EXPECT_EQ(bulb_.state().brightness, 100);
    EXPECT_EQ(proxy.lastStatus().brightness, 100);
}

TEST_F(DeviceProxyTest, SetColor) {
    DeviceProxy proxy(configFor());

    proxy.setColor(255, 128, 0);
    EXPECT_EQ(bulb_.state().color, (RgbColor{255, 128, 0}));
    EXPECT_EQ(proxy.lastStatus().color, (RgbColor{255, 128, 0}));
}

TEST_F(DeviceProxyTest, SetColorFromHex) {
    DeviceProxy proxy(configFor());

    proxy.setColorFromHex("#00FF7f");
    EXPECT_EQ(bulb_.state().color, (RgbColor{0, 255, 127}));

    proxy.setColorFromHex("102030");
    EXPECT_EQ(bulb_.state().color, (RgbColor{16, 32, 48}));
}

TEST_F(DeviceProxyTest, GetStatusMergesDeviceState) {
    DeviceProxy proxy(configFor());
    proxy.setBrightness(42);

    DeviceStatus status = proxy.getStatus();
    EXPECT_TRUE(status.connected);
    EXPECT_FALSE(status.power);
    EXPECT_EQ(status.brightness, 42);
    EXPECT_EQ(status.temperature.value_or(0), 3000);
}

TEST_F(DeviceProxyTest, Ping) {
    DeviceProxy proxy(configFor());
    EXPECT_TRUE(proxy.ping());
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(DeviceProxyTest, InvalidBrightnessSendsNothing) {
    DeviceProxy proxy(configFor());

    try {
        proxy.setBrightness(101);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Brightness must be between 0 and 100");
        EXPECT_EQ(e.kind(), ErrorKind::VALIDATION);
    }
    EXPECT_THROW(proxy.setBrightness(-1), ValidationError);

    EXPECT_EQ(bulb_.requestCount(), 0u);
}

TEST_F(DeviceProxyTest, InvalidColorSendsNothing) {
    DeviceProxy proxy(configFor());

    try {
        proxy.setColor(0, 256, 0);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "RGB values must be between 0 and 255");
    }
    EXPECT_THROW(proxy.setColor(-1, 0, 0), ValidationError);
    EXPECT_THROW(proxy.setColorFromHex("#12345"), FormatError);
    EXPECT_THROW(proxy.setColorFromHex("zz0000"), FormatError);

    EXPECT_EQ(bulb_.requestCount(), 0u);
}

TEST(DeviceProxyHexTest, ParseHexColor) {
    EXPECT_EQ(DeviceProxy::parseHexColor("#FF0000"), (RgbColor{255, 0, 0}));
    EXPECT_EQ(DeviceProxy::parseHexColor("00ff00"), (RgbColor{0, 255, 0}));
    EXPECT_EQ(DeviceProxy::parseHexColor("#0000Ff"), (RgbColor{0, 0, 255}));
}

TEST(DeviceProxyHexTest, RejectsMalformedHex) {
    for (const char* hex : {"", "#", "#FFF", "FF00000", "#GG0000", "##FF0000", " FF0000"}) {
        try {
            DeviceProxy::parseHexColor(hex);
            FAIL() << "Expected FormatError for '" << hex << "'";
        } catch (const FormatError& e) {
            EXPECT_STREQ(e.what(), "Invalid hex color format");
            EXPECT_EQ(e.kind(), ErrorKind::FORMAT);
        }
    }
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(DeviceProxyTest, SilentDeviceTimesOut) {
    bulb_.setMuted(true);
    DeviceProxy proxy(configFor(150));

    EXPECT_THROW(proxy.turnOn(), TimeoutError);
    EXPECT_FALSE(proxy.ping());
}

TEST_F(DeviceProxyTest, FailedStatusQueryMarksDisconnected) {
    DeviceProxy proxy(configFor(150));
    proxy.setBrightness(70);
    ASSERT_TRUE(proxy.getStatus().connected);

    bulb_.setMuted(true);
    DeviceStatus status = proxy.getStatus();
    EXPECT_FALSE(status.connected);
    EXPECT_EQ(status.brightness, 70);

    // The flag persists until the next successful exchange
    EXPECT_FALSE(proxy.lastStatus().connected);

    bulb_.setMuted(false);
    EXPECT_TRUE(proxy.ping());
    EXPECT_TRUE(proxy.getStatus().connected);
}

TEST(DeviceProxyScriptedTest, ReplyWithoutDataRestoresConnected) {
    // A bulb that acknowledges commands with {"success":true,"id":...} only
    lumen::net::UdpSocket peer;
    ASSERT_TRUE(peer.bind(0, "127.0.0.1"));

    DeviceConfig config;
    config.address = "127.0.0.1";
    config.port = peer.getLocalPort();
    config.timeout_ms = 150;
    DeviceProxy proxy(config);

    // Unanswered status query
    EXPECT_FALSE(proxy.getStatus().connected);
    ASSERT_FALSE(proxy.lastStatus().connected);

    auto answerNext = [&peer](const std::string& expected) {
        char buffer[2048];
        lumen::net::SocketAddress from;
        for (int attempt = 0; attempt < 10; ++attempt) {
            int received = peer.receiveFrom(buffer, sizeof(buffer), 2000, from);
            if (received <= 0) {
                return false;
            }
            auto request = protocol::parseJson(buffer, static_cast<size_t>(received));
            if (!request || (*request)["command"].asString() != expected) {
                continue;   // the earlier get_status
            }
            Json::Value reply(Json::objectValue);
            reply["success"] = true;
            reply["id"] = (*request)["id"];
            std::string payload = protocol::toCompactJson(reply);
            peer.sendTo(from, payload.data(), payload.size());
            return true;
        }
        return false;
    };

    auto ping = std::async(std::launch::async, [&proxy]() { return proxy.ping(); });
    ASSERT_TRUE(answerNext("ping"));
    EXPECT_TRUE(ping.get());
    EXPECT_TRUE(proxy.lastStatus().connected);

    EXPECT_FALSE(proxy.getStatus().connected);

    auto brightness = std::async(std::launch::async, [&proxy]() { proxy.setBrightness(30); });
    ASSERT_TRUE(answerNext("set_brightness"));
    brightness.get();
    EXPECT_TRUE(proxy.lastStatus().connected);
}

TEST_F(DeviceProxyTest, DeviceRejectionIsProtocolError) {
    // Values the proxy would reject are never sent, so reach the device's
    // own error path through an unknown command
    CorrelatorConfig raw;
    raw.address = "127.0.0.1";
    raw.port = bulb_.port();
    CommandCorrelator correlator(raw);
    ASSERT_TRUE(correlator.start());

    try {
        correlator.send(Command("reboot"));
        FAIL() << "Expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_STREQ(e.what(), "Unknown command: reboot");
    }
}

TEST_F(DeviceProxyTest, CloseRejectsFurtherCommands) {
    DeviceProxy proxy(configFor());
    EXPECT_FALSE(proxy.isClosed());

    proxy.close();
    proxy.close();
    EXPECT_TRUE(proxy.isClosed());

    EXPECT_THROW(proxy.turnOn(), ClosedError);
    EXPECT_FALSE(proxy.ping());
    EXPECT_FALSE(proxy.getStatus().connected);
}

// =============================================================================
// Status listener
// =============================================================================

TEST_F(DeviceProxyTest, StatusListenerSeesMergedState) {
    DeviceProxy proxy(configFor());

    std::atomic<int> calls{0};
    std::atomic<int> lastBrightness{-1};
    proxy.setStatusListener([&](const DeviceStatus& status) {
        lastBrightness.store(status.brightness);
        ++calls;
    });

    proxy.setBrightness(25);

    // Listener runs before the command completes
    EXPECT_GE(calls.load(), 1);
    EXPECT_EQ(lastBrightness.load(), 25);

    proxy.setStatusListener(nullptr);
}
