/**
 * @file device_proxy.cpp
 * @brief DeviceProxy implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/device_proxy.hpp"
#include "lumen/core/errors.hpp"
#include "lumen/utils/logger.hpp"

#include <cctype>

namespace lumen {
namespace core {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool inRange(int value, int low, int high) {
    return value >= low && value <= high;
}

}  // namespace

DeviceProxy::DeviceProxy(const DeviceConfig& config)
    : config_(config)
{
    CorrelatorConfig correlatorConfig;
    correlatorConfig.address = config_.address;
    correlatorConfig.port = config_.port;
    correlatorConfig.timeout_ms = config_.timeout_ms;
    correlatorConfig.max_in_flight = config_.max_in_flight;

    correlator_ = std::make_unique<CommandCorrelator>(correlatorConfig);
    correlator_->setStatusHook([this](const Json::Value& data) { applyStatus(data); });
    correlator_->start();

    LOG_INFO("DeviceProxy", "Connected to bulb at {}", config_.key());
}

DeviceProxy::~DeviceProxy() {
    close();
}

void DeviceProxy::setPower(bool on) {
    Json::Value params(Json::objectValue);
    params["power"] = on;
    execute(Command(protocol::kSetPower, params));
    LOG_DEBUG("DeviceProxy", "{} power {}", config_.key(), on ? "on" : "off");
}

void DeviceProxy::setBrightness(int brightness) {
    if (!inRange(brightness, 0, 100)) {
        throw ValidationError("Brightness must be between 0 and 100");
    }

    Json::Value params(Json::objectValue);
    params["brightness"] = brightness;
    execute(Command(protocol::kSetBrightness, params));
    LOG_DEBUG("DeviceProxy", "{} brightness {}%", config_.key(), brightness);
}

void DeviceProxy::setColor(int r, int g, int b) {
    if (!inRange(r, 0, 255) || !inRange(g, 0, 255) || !inRange(b, 0, 255)) {
        throw ValidationError("RGB values must be between 0 and 255");
    }

    Json::Value params(Json::objectValue);
    params["color"]["r"] = r;
    params["color"]["g"] = g;
    params["color"]["b"] = b;
    execute(Command(protocol::kSetColor, params));
    LOG_DEBUG("DeviceProxy", "{} colour RGB({}, {}, {})", config_.key(), r, g, b);
}

void DeviceProxy::setColorFromHex(const std::string& hex) {
    RgbColor color = parseHexColor(hex);
    setColor(color.r, color.g, color.b);
}

DeviceStatus DeviceProxy::getStatus() {
    try {
        execute(Command(protocol::kGetStatus));
        return lastStatus();
    } catch (const LumenError& e) {
        LOG_DEBUG("DeviceProxy", "Status query to {} failed ({}): {}",
                  config_.key(), errorKindToString(e.kind()), e.what());
        markDisconnected();
        return lastStatus();
    }
}

bool DeviceProxy::ping() {
    try {
        execute(Command(protocol::kPing));
        return true;
    } catch (const LumenError& e) {
        LOG_DEBUG("DeviceProxy", "Ping to {} failed: {}", config_.key(), e.what());
        return false;
    }
}

DeviceStatus DeviceProxy::lastStatus() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

void DeviceProxy::setStatusListener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(statusMutex_);
    listener_ = std::move(listener);
}

void DeviceProxy::close() {
    if (correlator_->isClosed()) {
        return;
    }
    correlator_->close();
    LOG_INFO("DeviceProxy", "Disconnected from bulb at {}", config_.key());
}

bool DeviceProxy::isClosed() const {
    return correlator_->isClosed();
}

std::size_t DeviceProxy::inFlight() const {
    return correlator_->inFlight();
}

RgbColor DeviceProxy::parseHexColor(const std::string& hex) {
    std::size_t start = (!hex.empty() && hex[0] == '#') ? 1 : 0;
    if (hex.size() - start != 6) {
        throw FormatError("Invalid hex color format");
    }

    int channels[3];
    for (int i = 0; i < 3; ++i) {
        int high = hexDigit(hex[start + 2 * i]);
        int low = hexDigit(hex[start + 2 * i + 1]);
        if (high < 0 || low < 0) {
            throw FormatError("Invalid hex color format");
        }
        channels[i] = high * 16 + low;
    }

    return RgbColor{channels[0], channels[1], channels[2]};
}

Response DeviceProxy::execute(Command command) {
    Response response = correlator_->send(std::move(command));
    // The hook has already merged any object payload; this covers a reply with none
    if (!response.data.isObject()) {
        applyStatus(response.data);
    }
    return response;
}

void DeviceProxy::applyStatus(const Json::Value& data) {
    DeviceStatus merged;
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(statusMutex_);
        protocol::mergeStatus(status_, data);
        merged = status_;
        listener = listener_;
    }

    LOG_TRACE("DeviceProxy", "{} status: power={} brightness={}",
              config_.key(), merged.power, merged.brightness);

    if (listener) {
        listener(merged);
    }
}

void DeviceProxy::markDisconnected() {
    std::lock_guard<std::mutex> lock(statusMutex_);
    status_.connected = false;
}

}  // namespace core
}  // namespace lumen
