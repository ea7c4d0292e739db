/**
 * @file control_service.cpp
 * @brief ControlServiceImpl implementation.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#include "lumen/services/control_service.hpp"
#include "lumen/utils/logger.hpp"

namespace lumen {
namespace services {

namespace {

std::string endpoint(const core::DeviceConfig& config) {
    return config.address + ":" + std::to_string(config.port);
}

void fillStatus(const core::DeviceStatus& status, control::DeviceStatus* out) {
    out->set_power(status.power);
    out->set_brightness(status.brightness);
    out->mutable_color()->set_r(status.color.r);
    out->mutable_color()->set_g(status.color.g);
    out->mutable_color()->set_b(status.color.b);
    out->set_has_temperature(status.temperature.has_value());
    out->set_temperature(status.temperature.value_or(0));
    out->set_connected(status.connected);
}

void fillTarget(const core::DeviceConfig& config, control::Target* out) {
    out->set_address(config.address);
    out->set_port(config.port);
}

bool validPort(uint32_t port) {
    return port > 0 && port <= 65535;
}

grpc::Status runGuarded(const char* method, const std::function<grpc::Status()>& work) {
    try {
        return work();
    } catch (const core::LumenError& e) {
        LOG_DEBUG("ControlService", "{} failed ({}): {}",
                  method, core::errorKindToString(e.kind()), e.what());
        return toGrpcStatus(e);
    } catch (const std::exception& e) {
        LOG_ERROR("ControlService", "{} failed: {}", method, e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL,
                            std::string("Tool execution failed: ") + e.what());
    }
}

}  // namespace

grpc::Status toGrpcStatus(const core::LumenError& error) {
    grpc::StatusCode code;
    switch (error.kind()) {
        case core::ErrorKind::VALIDATION:
        case core::ErrorKind::FORMAT:
            code = grpc::StatusCode::INVALID_ARGUMENT;
            break;
        case core::ErrorKind::TIMEOUT:
            code = grpc::StatusCode::DEADLINE_EXCEEDED;
            break;
        case core::ErrorKind::PROTOCOL:
            code = grpc::StatusCode::ABORTED;
            break;
        case core::ErrorKind::TRANSPORT:
        case core::ErrorKind::CLOSED:
            code = grpc::StatusCode::UNAVAILABLE;
            break;
        case core::ErrorKind::BACKPRESSURE:
            code = grpc::StatusCode::RESOURCE_EXHAUSTED;
            break;
        default:
            code = grpc::StatusCode::INTERNAL;
            break;
    }
    return grpc::Status(code, error.what());
}

// =============================================================================
// DeviceCallReactor
// =============================================================================

/**
 * Unary reactor whose body runs on the worker pool. The handler returns
 * immediately; Finish() is called from the worker once the body is done.
 */
class DeviceCallReactor : public grpc::ServerUnaryReactor {
public:
    DeviceCallReactor(WorkerPool& pool, const char* method, std::function<grpc::Status()> work) {
        bool queued = pool.submit([this, method, work = std::move(work)]() {
            Finish(runGuarded(method, work));
        });
        if (!queued) {
            Finish(grpc::Status(grpc::StatusCode::UNAVAILABLE, "Service is shutting down"));
        }
    }

    void OnDone() override {
        delete this;
    }
};

// =============================================================================
// ControlServiceImpl
// =============================================================================

ControlServiceImpl::ControlServiceImpl(std::shared_ptr<core::DeviceRegistry> registry,
                                       std::shared_ptr<core::DiscoveryBroadcaster> discovery,
                                       ControlServiceConfig config)
    : registry_(std::move(registry))
    , discovery_(std::move(discovery))
    , config_(std::move(config))
    , workers_(config_.workers)
{
    LOG_INFO("ControlService", "Created control service ({} workers)", workers_.size());
}

ControlServiceImpl::~ControlServiceImpl() = default;

grpc::ServerUnaryReactor* ControlServiceImpl::dispatch(grpc::CallbackServerContext* /*context*/,
                                                       const char* method,
                                                       std::function<grpc::Status()> work) {
    LOG_TRACE("ControlService", "{} queued", method);
    return new DeviceCallReactor(workers_, method, std::move(work));
}

std::shared_ptr<core::DeviceProxy> ControlServiceImpl::resolveTarget(
    bool hasTarget, const control::Target& target, grpc::Status& status) const {
    if (hasTarget && !target.address().empty()) {
        if (!validPort(target.port())) {
            status = grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                  "Port must be between 1 and 65535");
            return nullptr;
        }
        auto proxy = registry_->find(target.address(), static_cast<uint16_t>(target.port()));
        if (!proxy) {
            status = grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                                  "No connection to bulb at " + target.address() + ":" +
                                  std::to_string(target.port()));
        }
        return proxy;
    }

    std::shared_ptr<core::DeviceProxy> proxy;
    if (config_.has_default_device) {
        proxy = registry_->find(config_.default_address, config_.default_port);
    }
    if (!proxy) {
        status = grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                              "No default bulb connection available");
    }
    return proxy;
}

// =============================================================================
// Power
// =============================================================================

grpc::ServerUnaryReactor* ControlServiceImpl::TurnOn(
    grpc::CallbackServerContext* context,
    const control::DeviceRequest* request,
    control::CommandReply* response) {

    return dispatch(context, "TurnOn", [this, request, response]() {
        grpc::Status status;
        auto bulb = resolveTarget(request->has_target(), request->target(), status);
        if (!bulb) {
            return status;
        }
        bulb->turnOn();
        response->set_message("Successfully turned on bulb at " + endpoint(bulb->config()));
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::TurnOff(
    grpc::CallbackServerContext* context,
    const control::DeviceRequest* request,
    control::CommandReply* response) {

    return dispatch(context, "TurnOff", [this, request, response]() {
        grpc::Status status;
        auto bulb = resolveTarget(request->has_target(), request->target(), status);
        if (!bulb) {
            return status;
        }
        bulb->turnOff();
        response->set_message("Successfully turned off bulb at " + endpoint(bulb->config()));
        return grpc::Status::OK;
    });
}

// =============================================================================
// Brightness / Color
// =============================================================================

grpc::ServerUnaryReactor* ControlServiceImpl::SetBrightness(
    grpc::CallbackServerContext* context,
    const control::SetBrightnessRequest* request,
    control::CommandReply* response) {

    return dispatch(context, "SetBrightness", [this, request, response]() {
        grpc::Status status;
        auto bulb = resolveTarget(request->has_target(), request->target(), status);
        if (!bulb) {
            return status;
        }
        bulb->setBrightness(request->brightness());
        response->set_message("Successfully set brightness to " +
                              std::to_string(request->brightness()) + "% on bulb at " +
                              endpoint(bulb->config()));
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::SetColor(
    grpc::CallbackServerContext* context,
    const control::SetColorRequest* request,
    control::CommandReply* response) {

    return dispatch(context, "SetColor", [this, request, response]() {
        if (request->color_case() == control::SetColorRequest::COLOR_NOT_SET) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "Color must be a hex string or RGB object");
        }

        grpc::Status status;
        auto bulb = resolveTarget(request->has_target(), request->target(), status);
        if (!bulb) {
            return status;
        }

        std::string described;
        if (request->color_case() == control::SetColorRequest::kHex) {
            bulb->setColorFromHex(request->hex());
            described = request->hex();
        } else {
            const auto& rgb = request->rgb();
            bulb->setColor(rgb.r(), rgb.g(), rgb.b());
            described = "RGB(" + std::to_string(rgb.r()) + ", " + std::to_string(rgb.g()) +
                        ", " + std::to_string(rgb.b()) + ")";
        }

        response->set_message("Successfully set color to " + described + " on bulb at " +
                              endpoint(bulb->config()));
        return grpc::Status::OK;
    });
}

// =============================================================================
// Status / Ping
// =============================================================================

grpc::ServerUnaryReactor* ControlServiceImpl::GetStatus(
    grpc::CallbackServerContext* context,
    const control::DeviceRequest* request,
    control::StatusReply* response) {

    return dispatch(context, "GetStatus", [this, request, response]() {
        grpc::Status status;
        auto bulb = resolveTarget(request->has_target(), request->target(), status);
        if (!bulb) {
            return status;
        }
        core::DeviceStatus current = bulb->getStatus();
        fillTarget(bulb->config(), response->mutable_device());
        fillStatus(current, response->mutable_status());
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::Ping(
    grpc::CallbackServerContext* context,
    const control::DeviceRequest* request,
    control::PingReply* response) {

    return dispatch(context, "Ping", [this, request, response]() {
        grpc::Status status;
        auto bulb = resolveTarget(request->has_target(), request->target(), status);
        if (!bulb) {
            return status;
        }
        fillTarget(bulb->config(), response->mutable_device());
        response->set_reachable(bulb->ping());
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::GetAllStatuses(
    grpc::CallbackServerContext* context,
    const control::AllStatusesRequest* /*request*/,
    control::AllStatusesReply* response) {

    return dispatch(context, "GetAllStatuses", [this, response]() {
        for (const auto& [device, status] : registry_->allStatuses()) {
            auto* entry = response->add_statuses();
            fillTarget(device, entry->mutable_device());
            fillStatus(status, entry->mutable_status());
        }
        return grpc::Status::OK;
    });
}

// =============================================================================
// Device management
// =============================================================================

grpc::ServerUnaryReactor* ControlServiceImpl::DiscoverDevices(
    grpc::CallbackServerContext* context,
    const control::DiscoverRequest* request,
    control::DiscoverReply* response) {

    return dispatch(context, "DiscoverDevices", [this, request, response]() {
        auto devices = discovery_->discover(request->timeout_ms());
        for (const auto& device : devices) {
            auto* out = response->add_devices();
            out->set_address(device.address);
            out->set_port(device.port);
            out->set_name(device.name.value_or(""));
            out->set_model(device.model.value_or(""));
            out->set_firmware_version(device.firmware_version.value_or(""));
            out->set_mac_address(device.mac_address.value_or(""));
        }
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::ConnectDevice(
    grpc::CallbackServerContext* context,
    const control::ConnectRequest* request,
    control::CommandReply* response) {

    return dispatch(context, "ConnectDevice", [this, request, response]() {
        if (request->address().empty() || request->port() == 0) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "Both ip and port are required");
        }
        if (!validPort(request->port())) {
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                                "Port must be between 1 and 65535");
        }

        auto bulb = registry_->getOrConnect(request->address(),
                                            static_cast<uint16_t>(request->port()));
        response->set_message("Successfully connected to bulb at " + endpoint(bulb->config()));
        return grpc::Status::OK;
    });
}

grpc::ServerUnaryReactor* ControlServiceImpl::DisconnectDevice(
    grpc::CallbackServerContext* context,
    const control::ConnectRequest* request,
    control::CommandReply* response) {

    return dispatch(context, "DisconnectDevice", [this, request, response]() {
        const std::string where = request->address() + ":" + std::to_string(request->port());
        if (!validPort(request->port()) ||
            !registry_->disconnect(request->address(), static_cast<uint16_t>(request->port()))) {
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                                "No connection to bulb at " + where);
        }
        response->set_message("Disconnected from bulb at " + where);
        return grpc::Status::OK;
    });
}

}  // namespace services
}  // namespace lumen
