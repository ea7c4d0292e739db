/**
 * @file command_correlator.cpp
 * @brief CommandCorrelator implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/core/command_correlator.hpp"
#include "lumen/core/errors.hpp"
#include "lumen/utils/logger.hpp"
#include "lumen/utils/token.hpp"

#include <vector>

namespace lumen {
namespace core {

namespace {

// Largest UDP payload
constexpr std::size_t kReceiveBufferSize = 65535;

}  // namespace

CommandCorrelator::CommandCorrelator(const CorrelatorConfig& config)
    : config_(config)
{
    if (!socket_.isValid()) {
        throw TransportError("Failed to create UDP socket: " + socket_.getLastErrorString());
    }

    auto resolved = net::SocketAddress::resolve(config_.address, config_.port);
    if (!resolved) {
        throw TransportError("Could not resolve device address '" + config_.address + "'");
    }
    destination_ = *resolved;

    // Ephemeral port; replies come back to whatever the OS picks
    if (!socket_.bind(0)) {
        throw TransportError("Failed to bind UDP socket: " + socket_.getLastErrorString());
    }

    LOG_DEBUG("Correlator", "Created for {} on local port {}",
              destination_.toString(), socket_.getLocalPort());
}

CommandCorrelator::~CommandCorrelator() {
    close();
}

void CommandCorrelator::setStatusHook(StatusHook hook) {
    statusHook_ = std::move(hook);
}

bool CommandCorrelator::start() {
    if (closed_.load()) {
        LOG_WARN("Correlator", "Cannot start a closed correlator for {}",
                 destination_.toString());
        return false;
    }
    if (running_.exchange(true)) {
        return false;
    }

    listenerThread_ = std::thread(&CommandCorrelator::listenerLoop, this);
    return true;
}

Response CommandCorrelator::send(Command command) {
    if (closed_.load()) {
        throw ClosedError();
    }

    auto request = std::make_shared<PendingRequest>();
    std::future<Response> result = request->promise.get_future();
    request->deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.timeout_ms);

    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        // Checked again under the lock so close() cannot miss this entry
        if (closed_.load()) {
            throw ClosedError();
        }
        if (config_.max_in_flight > 0 && pending_.size() >= config_.max_in_flight) {
            throw BackpressureError("Too many commands in flight for " +
                                    destination_.toString() + " (limit " +
                                    std::to_string(config_.max_in_flight) + ")");
        }
        command.id = nextToken();
        pending_.emplace(command.id, request);
    }

    const std::string payload = protocol::encodeCommand(command);
    LOG_TRACE("Correlator", "-> {} {}", destination_.toString(), payload);

    int sent;
    std::string reason;
    {
        // Fails cleanly with -1 once close() has released the socket
        std::shared_lock<std::shared_mutex> socketLock(socketMutex_);
        sent = socket_.sendTo(destination_, payload.data(), payload.size());
        if (sent < 0) {
            reason = socket_.getLastErrorString();
        }
    }
    if (sent < 0) {
        if (takePending(command.id)) {
            throw TransportError("Failed to send '" + command.command + "' to " +
                                 destination_.toString() + ": " + reason);
        }
        // close() got there first and already failed the promise
        return result.get();
    }

    if (result.wait_until(request->deadline) == std::future_status::timeout) {
        if (takePending(command.id)) {
            LOG_DEBUG("Correlator", "Command '{}' ({}) to {} timed out after {}ms",
                      command.command, command.id, destination_.toString(),
                      config_.timeout_ms);
            throw TimeoutError("Command timeout");
        }
        // Resolved between the wait expiring and taking the lock
    }

    return result.get();
}

void CommandCorrelator::close() {
    std::lock_guard<std::mutex> closeLock(closeMutex_);
    if (closed_.exchange(true)) {
        return;
    }

    std::unordered_map<std::string, std::shared_ptr<PendingRequest>> failed;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        failed.swap(pending_);
    }

    for (auto& [id, request] : failed) {
        request->promise.set_exception(std::make_exception_ptr(ClosedError()));
    }

    running_.store(false);
    if (listenerThread_.joinable()) {
        listenerThread_.join();
    }

    // Only after the listener is gone and no sender is inside sendTo()
    {
        std::unique_lock<std::shared_mutex> socketLock(socketMutex_);
        socket_.close();
    }

    if (!failed.empty()) {
        LOG_DEBUG("Correlator", "Closed {} with {} command(s) in flight",
                  destination_.toString(), failed.size());
    }
}

std::size_t CommandCorrelator::inFlight() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_.size();
}

uint16_t CommandCorrelator::getLocalPort() const {
    std::shared_lock<std::shared_mutex> socketLock(socketMutex_);
    return socket_.getLocalPort();
}

void CommandCorrelator::listenerLoop() {
    LOG_DEBUG("Correlator", "Listener started for {}", destination_.toString());

    std::vector<char> buffer(kReceiveBufferSize);

    while (running_.load()) {
        net::SocketAddress sender;
        int received = socket_.receiveFrom(buffer.data(), buffer.size(),
                                           config_.poll_interval_ms, sender);

        if (received > 0) {
            handleDatagram(buffer.data(), static_cast<std::size_t>(received), sender);
        } else if (received < 0 && running_.load()) {
            LOG_ERROR("Correlator", "Receive error on {}: {}",
                      destination_.toString(), socket_.getLastErrorString());
        }
    }

    LOG_DEBUG("Correlator", "Listener stopped for {}", destination_.toString());
}

void CommandCorrelator::handleDatagram(const char* data, std::size_t length,
                                       const net::SocketAddress& sender) {
    auto response = protocol::decodeResponse(data, length);
    if (!response) {
        LOG_WARN("Correlator", "Dropping malformed datagram ({} bytes) from {}",
                 length, sender.toString());
        return;
    }

    LOG_TRACE("Correlator", "<- {} {}", sender.toString(),
              std::string(data, length));

    // Status first, so a caller woken below already sees the merged state
    if (response->data.isObject() && statusHook_) {
        statusHook_(response->data);
    }

    if (!response->id) {
        return;
    }

    auto request = takePending(*response->id);
    if (!request) {
        // Late, duplicate or foreign reply
        LOG_TRACE("Correlator", "No command in flight for id '{}'", *response->id);
        return;
    }

    if (response->success) {
        request->promise.set_value(std::move(*response));
    } else {
        std::string message = response->error ? *response->error : "Unknown error";
        request->promise.set_exception(std::make_exception_ptr(ProtocolError(message)));
    }
}

std::shared_ptr<CommandCorrelator::PendingRequest>
CommandCorrelator::takePending(const std::string& id) {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto request = std::move(it->second);
    pending_.erase(it);
    return request;
}

std::string CommandCorrelator::nextToken() const {
    std::string token = utils::TokenGenerator::generate();
    while (pending_.count(token) != 0) {
        token = utils::TokenGenerator::generate();
    }
    return token;
}

}  // namespace core
}  // namespace lumen
