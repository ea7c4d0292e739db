/**
 * @file control_service.hpp
 * @brief Callback gRPC service exposing bulb control to applications.
 *
 * BulbControl is the API that lumen-cli and other clients use:
 * - TurnOn / TurnOff / SetBrightness / SetColor: drive one bulb
 * - GetStatus / Ping / GetAllStatuses: inspect bulbs
 * - DiscoverDevices / ConnectDevice / DisconnectDevice: manage the device set
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/services/export.hpp"
#include "lumen/services/worker_pool.hpp"
#include "lumen/core/device_registry.hpp"
#include "lumen/core/discovery_broadcaster.hpp"
#include "lumen/core/errors.hpp"

#include <grpcpp/grpcpp.h>
#include <functional>
#include <memory>
#include <string>

// Include generated gRPC service base
#include "lumen/proto/control.grpc.pb.h"

namespace lumen {
namespace services {

/**
 * @brief Settings for the control service.
 */
struct LUMEN_SERVICES_API ControlServiceConfig {
    bool has_default_device = true;
    std::string default_address = "192.168.1.45";
    uint16_t default_port = 4000;
    size_t workers = 4;                 ///< Threads running blocking device calls
};

/**
 * @brief Map a core error to the gRPC status reported to clients.
 */
LUMEN_SERVICES_API grpc::Status toGrpcStatus(const core::LumenError& error);

/**
 * @class ControlServiceImpl
 * @brief Implementation of the BulbControl gRPC service.
 *
 * Device calls block for up to the command timeout, so every RPC hands
 * its work to an internal worker pool and finishes its reactor from there.
 * The worker pool drains when the service is destroyed; shut the server
 * down first.
 *
 * Usage:
 * @code
 * auto registry = std::make_shared<core::DeviceRegistry>();
 * auto discovery = std::make_shared<core::DiscoveryBroadcaster>();
 * ControlServiceImpl service(registry, discovery, ControlServiceConfig{});
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("0.0.0.0:50061", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class LUMEN_SERVICES_API ControlServiceImpl final : public control::BulbControl::CallbackService {
public:
    ControlServiceImpl(std::shared_ptr<core::DeviceRegistry> registry,
                       std::shared_ptr<core::DiscoveryBroadcaster> discovery,
                       ControlServiceConfig config);

    ~ControlServiceImpl() override;

    // =========================================================================
    // gRPC Service Methods (Async Callback API)
    // =========================================================================

    grpc::ServerUnaryReactor* TurnOn(
        grpc::CallbackServerContext* context,
        const control::DeviceRequest* request,
        control::CommandReply* response) override;

    grpc::ServerUnaryReactor* TurnOff(
        grpc::CallbackServerContext* context,
        const control::DeviceRequest* request,
        control::CommandReply* response) override;

    /**
     * @brief Handle SetBrightness RPC.
     * Out-of-range values fail with INVALID_ARGUMENT and reach no device.
     */
    grpc::ServerUnaryReactor* SetBrightness(
        grpc::CallbackServerContext* context,
        const control::SetBrightnessRequest* request,
        control::CommandReply* response) override;

    /**
     * @brief Handle SetColor RPC.
     * Accepts either a hex string or an RGB triple.
     */
    grpc::ServerUnaryReactor* SetColor(
        grpc::CallbackServerContext* context,
        const control::SetColorRequest* request,
        control::CommandReply* response) override;

    /**
     * @brief Handle GetStatus RPC.
     * Never fails for an unreachable bulb; the status reports connected=false.
     */
    grpc::ServerUnaryReactor* GetStatus(
        grpc::CallbackServerContext* context,
        const control::DeviceRequest* request,
        control::StatusReply* response) override;

    grpc::ServerUnaryReactor* Ping(
        grpc::CallbackServerContext* context,
        const control::DeviceRequest* request,
        control::PingReply* response) override;

    /**
     * @brief Handle DiscoverDevices RPC.
     * Blocks a worker for the whole discovery window.
     */
    grpc::ServerUnaryReactor* DiscoverDevices(
        grpc::CallbackServerContext* context,
        const control::DiscoverRequest* request,
        control::DiscoverReply* response) override;

    grpc::ServerUnaryReactor* ConnectDevice(
        grpc::CallbackServerContext* context,
        const control::ConnectRequest* request,
        control::CommandReply* response) override;

    grpc::ServerUnaryReactor* DisconnectDevice(
        grpc::CallbackServerContext* context,
        const control::ConnectRequest* request,
        control::CommandReply* response) override;

    grpc::ServerUnaryReactor* GetAllStatuses(
        grpc::CallbackServerContext* context,
        const control::AllStatusesRequest* request,
        control::AllStatusesReply* response) override;

private:
    std::shared_ptr<core::DeviceRegistry> registry_;
    std::shared_ptr<core::DiscoveryBroadcaster> discovery_;
    ControlServiceConfig config_;
    WorkerPool workers_;

    /**
     * @brief Run `work` on the pool and finish the reactor with its status.
     * LumenErrors thrown by `work` are mapped through toGrpcStatus().
     */
    grpc::ServerUnaryReactor* dispatch(grpc::CallbackServerContext* context,
                                       const char* method,
                                       std::function<grpc::Status()> work);

    /**
     * @brief Resolve the bulb an RPC acts on.
     * @return nullptr with `status` set to FAILED_PRECONDITION if not connected.
     */
    std::shared_ptr<core::DeviceProxy> resolveTarget(bool hasTarget,
                                                     const control::Target& target,
                                                     grpc::Status& status) const;
};

}  // namespace services
}  // namespace lumen
