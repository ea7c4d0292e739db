/**
 * @file mock_bulb.cpp
 * @brief MockBulb implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "mock_bulb.hpp"

#include "lumen/utils/logger.hpp"

#include <chrono>
#include <stdexcept>

namespace lumen {
namespace mock {

namespace {

bool isChannel(const Json::Value& value) {
    return value.isNumeric() && value.asDouble() >= 0 && value.asDouble() <= 255;
}

}  // namespace

Json::Value MockBulbState::toJson() const {
    Json::Value out(Json::objectValue);
    out["power"] = power;
    out["brightness"] = brightness;
    out["color"]["r"] = color.r;
    out["color"]["g"] = color.g;
    out["color"]["b"] = color.b;
    out["temperature"] = temperature;
    return out;
}

MockBulb::MockBulb(uint16_t port, std::string name, std::string bindAddress)
    : port_(port)
    , name_(std::move(name))
    , bindAddress_(std::move(bindAddress))
{
}

MockBulb::~MockBulb() {
    stop();
}

bool MockBulb::start() {
    if (running_.load()) {
        return false;
    }
    if (!socket_.isValid()) {
        LOG_ERROR("MockBulb", "Socket not valid");
        return false;
    }
    if (!socket_.bind(port_, bindAddress_)) {
        LOG_ERROR("MockBulb", "Failed to bind {}:{}", bindAddress_, port_);
        return false;
    }
    port_ = socket_.getLocalPort();

    running_.store(true);
    thread_ = std::thread(&MockBulb::serveLoop, this);

    LOG_INFO("MockBulb", "Mock Smart Bulb \"{}\" listening on port {}", name_, port_);
    return true;
}

void MockBulb::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    socket_.close();
    LOG_INFO("MockBulb", "Mock Smart Bulb \"{}\" stopped", name_);
}

MockBulbState MockBulb::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

std::vector<std::string> MockBulb::commands() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return commands_;
}

void MockBulb::serveLoop() {
    std::vector<char> buffer(65535);

    while (running_.load()) {
        net::SocketAddress sender;
        int received = socket_.receiveFrom(buffer.data(), buffer.size(), 100, sender);
        if (received <= 0) {
            continue;
        }
        ++requestCount_;

        auto request = core::protocol::parseJson(buffer.data(), static_cast<std::size_t>(received));
        if (!request || !request->isObject()) {
            LOG_WARN("MockBulb", "Failed to parse request from {}", sender.toString());
            continue;
        }

        if (muted_.load()) {
            LOG_DEBUG("MockBulb", "Muted, dropping request from {}", sender.toString());
            continue;
        }

        Json::Value reply = handleRequest(*request);
        const std::string payload = core::protocol::toCompactJson(reply);

        int delayMs = replyDelayMs_.load();
        if (delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        }

        int copies = duplicateReplies_.load() ? 2 : 1;
        for (int i = 0; i < copies; ++i) {
            if (socket_.sendTo(sender, payload.data(), payload.size()) < 0) {
                LOG_ERROR("MockBulb", "Failed to send response to {}: {}",
                          sender.toString(), socket_.getLastErrorString());
            }
        }
        LOG_DEBUG("MockBulb", "Response sent to {}", sender.toString());
    }
}

Json::Value MockBulb::handleRequest(const Json::Value& request) {
    const Json::Value& commandValue = request["command"];
    const std::string command = commandValue.isString() ? commandValue.asString() : "undefined";
    const Json::Value& params = request["params"];

    LOG_INFO("MockBulb", "Received command: {}", command);

    Json::Value response(Json::objectValue);
    response["success"] = true;
    if (request.isMember("id")) {
        response["id"] = request["id"];
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    commands_.push_back(command);

    try {
        if (command == core::protocol::kPing) {
            response["data"]["pong"] = true;
        } else if (command == core::protocol::kDiscover) {
            const Json::Value& type = request["type"];
            if (type.isString() && type.asString() == core::protocol::kDiscoveryType) {
                Json::Value discovery(Json::objectValue);
                discovery["type"] = core::protocol::kDiscoveryResponseType;
                discovery["data"]["name"] = name_;
                discovery["data"]["model"] = "MockBulb v1.0";
                discovery["data"]["firmwareVersion"] = "1.0.0";
                discovery["data"]["macAddress"] = "00:11:22:33:44:55";
                return discovery;
            }
        } else if (command == core::protocol::kSetPower) {
            if (!params.isObject() || !params["power"].isBool()) {
                throw std::invalid_argument("Invalid power parameter");
            }
            state_.power = params["power"].asBool();
            response["data"]["power"] = state_.power;
            LOG_INFO("MockBulb", "Power {}", state_.power ? "ON" : "OFF");
        } else if (command == core::protocol::kSetBrightness) {
            const Json::Value& brightness = params.isObject() ? params["brightness"] : Json::Value::nullSingleton();
            if (!brightness.isNumeric() || brightness.asDouble() < 0 || brightness.asDouble() > 100) {
                throw std::invalid_argument("Invalid brightness parameter (must be 0-100)");
            }
            state_.brightness = brightness.asInt();
            response["data"]["brightness"] = state_.brightness;
            LOG_INFO("MockBulb", "Brightness set to {}%", state_.brightness);
        } else if (command == core::protocol::kSetColor) {
            const Json::Value& color = params.isObject() ? params["color"] : Json::Value::nullSingleton();
            if (!color.isObject() || !isChannel(color["r"]) || !isChannel(color["g"]) ||
                !isChannel(color["b"])) {
                throw std::invalid_argument("Invalid color parameter (RGB values must be 0-255)");
            }
            state_.color = core::RgbColor{color["r"].asInt(), color["g"].asInt(), color["b"].asInt()};
            response["data"]["color"]["r"] = state_.color.r;
            response["data"]["color"]["g"] = state_.color.g;
            response["data"]["color"]["b"] = state_.color.b;
            LOG_INFO("MockBulb", "Color set to RGB({}, {}, {})",
                     state_.color.r, state_.color.g, state_.color.b);
        } else if (command == core::protocol::kGetStatus) {
            response["data"] = state_.toJson();
            response["data"]["connected"] = true;
        } else {
            throw std::invalid_argument("Unknown command: " + command);
        }
    } catch (const std::invalid_argument& e) {
        response["success"] = false;
        response["error"] = e.what();
        LOG_WARN("MockBulb", "Command failed: {}", e.what());
    }

    return response;
}

}  // namespace mock
}  // namespace lumen
