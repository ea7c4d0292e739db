/**
 * @file control_client.cpp
 * @brief gRPC client implementation
 */

#include "control_client.hpp"

#include <grpcpp/grpcpp.h>
#include "lumen/proto/control.grpc.pb.h"

#include <chrono>

namespace lumen::cli {

namespace {

// Device calls wait for the daemon's own command timeout; leave headroom
constexpr auto kCallTimeout = std::chrono::seconds(15);

std::string status_code_name(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case grpc::StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case grpc::StatusCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        case grpc::StatusCode::ABORTED: return "ABORTED";
        case grpc::StatusCode::UNAVAILABLE: return "UNAVAILABLE";
        case grpc::StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case grpc::StatusCode::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

void check(const grpc::Status& status) {
    if (!status.ok()) {
        throw RpcError(status_code_name(status.error_code()), status.error_message());
    }
}

void set_deadline(grpc::ClientContext& context, std::chrono::milliseconds timeout) {
    context.set_deadline(std::chrono::system_clock::now() + timeout);
}

void fill_target(const DeviceTarget& target, control::Target* out) {
    out->set_address(target.address);
    out->set_port(target.port);
}

BulbStatus from_proto(const control::StatusReply& reply) {
    BulbStatus status;
    status.address = reply.device().address();
    status.port = static_cast<uint16_t>(reply.device().port());
    status.power = reply.status().power();
    status.brightness = reply.status().brightness();
    status.r = reply.status().color().r();
    status.g = reply.status().color().g();
    status.b = reply.status().color().b();
    if (reply.status().has_temperature()) {
        status.temperature = reply.status().temperature();
    }
    status.connected = reply.status().connected();
    return status;
}

} // anonymous namespace

struct ControlClient::Impl {
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<control::BulbControl::Stub> stub;
    std::string address;
};

ControlClient::ControlClient() : impl_(std::make_unique<Impl>()) {}

ControlClient::~ControlClient() = default;

bool ControlClient::connect(const std::string& address) {
    impl_->channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());

    auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(5);
    if (!impl_->channel->WaitForConnected(deadline)) {
        impl_->channel.reset();
        return false;
    }

    impl_->stub = control::BulbControl::NewStub(impl_->channel);
    impl_->address = address;
    return true;
}

std::string ControlClient::get_address() const {
    return impl_->address;
}

std::string ControlClient::turn_on(const DeviceTarget& target) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::DeviceRequest request;
    if (!target.is_default()) fill_target(target, request.mutable_target());

    control::CommandReply reply;
    check(impl_->stub->TurnOn(&context, request, &reply));
    return reply.message();
}

std::string ControlClient::turn_off(const DeviceTarget& target) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::DeviceRequest request;
    if (!target.is_default()) fill_target(target, request.mutable_target());

    control::CommandReply reply;
    check(impl_->stub->TurnOff(&context, request, &reply));
    return reply.message();
}

std::string ControlClient::set_brightness(const DeviceTarget& target, int brightness) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::SetBrightnessRequest request;
    if (!target.is_default()) fill_target(target, request.mutable_target());
    request.set_brightness(brightness);

    control::CommandReply reply;
    check(impl_->stub->SetBrightness(&context, request, &reply));
    return reply.message();
}

std::string ControlClient::set_color_hex(const DeviceTarget& target, const std::string& hex) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::SetColorRequest request;
    if (!target.is_default()) fill_target(target, request.mutable_target());
    request.set_hex(hex);

    control::CommandReply reply;
    check(impl_->stub->SetColor(&context, request, &reply));
    return reply.message();
}

std::string ControlClient::set_color_rgb(const DeviceTarget& target, int r, int g, int b) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::SetColorRequest request;
    if (!target.is_default()) fill_target(target, request.mutable_target());
    request.mutable_rgb()->set_r(r);
    request.mutable_rgb()->set_g(g);
    request.mutable_rgb()->set_b(b);

    control::CommandReply reply;
    check(impl_->stub->SetColor(&context, request, &reply));
    return reply.message();
}

BulbStatus ControlClient::get_status(const DeviceTarget& target) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::DeviceRequest request;
    if (!target.is_default()) fill_target(target, request.mutable_target());

    control::StatusReply reply;
    check(impl_->stub->GetStatus(&context, request, &reply));
    return from_proto(reply);
}

bool ControlClient::ping(const DeviceTarget& target) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::DeviceRequest request;
    if (!target.is_default()) fill_target(target, request.mutable_target());

    control::PingReply reply;
    check(impl_->stub->Ping(&context, request, &reply));
    return reply.reachable();
}

std::vector<DiscoveredBulb> ControlClient::discover(int timeout_ms) {
    grpc::ClientContext context;
    int window = timeout_ms > 0 ? timeout_ms : 5000;
    set_deadline(context, std::chrono::milliseconds(window) + std::chrono::seconds(5));

    control::DiscoverRequest request;
    request.set_timeout_ms(timeout_ms);

    control::DiscoverReply reply;
    check(impl_->stub->DiscoverDevices(&context, request, &reply));

    std::vector<DiscoveredBulb> bulbs;
    for (const auto& device : reply.devices()) {
        DiscoveredBulb bulb;
        bulb.address = device.address();
        bulb.port = static_cast<uint16_t>(device.port());
        bulb.name = device.name();
        bulb.model = device.model();
        bulb.firmware_version = device.firmware_version();
        bulb.mac_address = device.mac_address();
        bulbs.push_back(std::move(bulb));
    }
    return bulbs;
}

std::string ControlClient::connect_device(const std::string& address, uint16_t port) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::ConnectRequest request;
    request.set_address(address);
    request.set_port(port);

    control::CommandReply reply;
    check(impl_->stub->ConnectDevice(&context, request, &reply));
    return reply.message();
}

std::string ControlClient::disconnect_device(const std::string& address, uint16_t port) {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::ConnectRequest request;
    request.set_address(address);
    request.set_port(port);

    control::CommandReply reply;
    check(impl_->stub->DisconnectDevice(&context, request, &reply));
    return reply.message();
}

std::vector<BulbStatus> ControlClient::get_all_statuses() {
    grpc::ClientContext context;
    set_deadline(context, kCallTimeout);

    control::AllStatusesRequest request;
    control::AllStatusesReply reply;
    check(impl_->stub->GetAllStatuses(&context, request, &reply));

    std::vector<BulbStatus> statuses;
    for (const auto& entry : reply.statuses()) {
        statuses.push_back(from_proto(entry));
    }
    return statuses;
}

} // namespace lumen::cli
