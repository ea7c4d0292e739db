/**
 * @file test_control_service.cpp
 * @brief Integration test: BulbControl gRPC service driving mock bulbs over UDP
 */

#include <gtest/gtest.h>
#include <lumen/utils/logger.hpp>
#include <lumen/core/device_registry.hpp>
#include <lumen/core/discovery_broadcaster.hpp>
#include <lumen/services/control_service.hpp>

#include "mock_bulb.hpp"

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>

#include <chrono>
#include <memory>
#include <string>

using namespace lumen;

/**
 * @brief In-process lumend: registry, discovery and the control service
 * on an ephemeral loopback port, with one mock bulb as the default device.
 */
class ControlServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::WARN);

        bulb_ = std::make_unique<mock::MockBulb>(0, "Living Room", "127.0.0.1");
        ASSERT_TRUE(bulb_->start());

        core::RegistryConfig registryConfig;
        registryConfig.timeout_ms = 300;
        registry_ = std::make_shared<core::DeviceRegistry>(registryConfig);

        core::DiscoveryConfig discoveryConfig;
        discoveryConfig.addresses = {"127.0.0.1"};
        discoveryConfig.ports = {bulb_->port()};
        discoveryConfig.default_timeout_ms = 300;
        discovery_ = std::make_shared<core::DiscoveryBroadcaster>(discoveryConfig);

        registry_->getOrConnect("127.0.0.1", bulb_->port());

        services::ControlServiceConfig serviceConfig;
        serviceConfig.default_address = "127.0.0.1";
        serviceConfig.default_port = bulb_->port();
        serviceConfig.workers = 2;
        service_ = std::make_unique<services::ControlServiceImpl>(
            registry_, discovery_, serviceConfig);

        int selectedPort = 0;
        grpc::ServerBuilder builder;
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &selectedPort);
        builder.RegisterService(service_.get());
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        ASSERT_GT(selectedPort, 0);

        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(selectedPort),
                                           grpc::InsecureChannelCredentials());
        stub_ = control::BulbControl::NewStub(channel);
    }

    void TearDown() override {
        if (server_) {
            server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
            server_->Wait();
        }
        service_.reset();
        registry_->disconnectAll();
        bulb_->stop();
    }

    std::unique_ptr<grpc::ClientContext> context() {
        auto ctx = std::make_unique<grpc::ClientContext>();
        ctx->set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(5));
        return ctx;
    }

    std::string bulbEndpoint() const {
        return "127.0.0.1:" + std::to_string(bulb_->port());
    }

    std::unique_ptr<mock::MockBulb> bulb_;
    std::shared_ptr<core::DeviceRegistry> registry_;
    std::shared_ptr<core::DiscoveryBroadcaster> discovery_;
    std::unique_ptr<services::ControlServiceImpl> service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<control::BulbControl::Stub> stub_;
};

// =============================================================================
// Default device
// =============================================================================

TEST_F(ControlServiceTest, TurnOnAndOffDefaultBulb) {
    control::DeviceRequest request;
    control::CommandReply reply;

    grpc::Status status = stub_->TurnOn(context().get(), request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(reply.message(), "Successfully turned on bulb at " + bulbEndpoint());
    EXPECT_TRUE(bulb_->state().power);

    status = stub_->TurnOff(context().get(), request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(reply.message(), "Successfully turned off bulb at " + bulbEndpoint());
    EXPECT_FALSE(bulb_->state().power);
}

TEST_F(ControlServiceTest, SetBrightness) {
    control::SetBrightnessRequest request;
    request.set_brightness(65);
    control::CommandReply reply;

    grpc::Status status = stub_->SetBrightness(context().get(), request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(reply.message(), "Successfully set brightness to 65% on bulb at " + bulbEndpoint());
    EXPECT_EQ(bulb_->state().brightness, 65);
}

TEST_F(ControlServiceTest, InvalidBrightnessNeverReachesBulb) {
    size_t before = bulb_->requestCount();

    control::SetBrightnessRequest request;
    request.set_brightness(150);
    control::CommandReply reply;

    grpc::Status status = stub_->SetBrightness(context().get(), request, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "Brightness must be between 0 and 100");
    EXPECT_EQ(bulb_->requestCount(), before);
}

TEST_F(ControlServiceTest, SetColorHexAndRgb) {
    control::SetColorRequest request;
    control::CommandReply reply;

    request.set_hex("#FF8000");
    grpc::Status status = stub_->SetColor(context().get(), request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(reply.message(), "Successfully set color to #FF8000 on bulb at " + bulbEndpoint());
    EXPECT_EQ(bulb_->state().color, (core::RgbColor{255, 128, 0}));

    request.mutable_rgb()->set_r(1);
    request.mutable_rgb()->set_g(2);
    request.mutable_rgb()->set_b(3);
    status = stub_->SetColor(context().get(), request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(reply.message(), "Successfully set color to RGB(1, 2, 3) on bulb at " + bulbEndpoint());
    EXPECT_EQ(bulb_->state().color, (core::RgbColor{1, 2, 3}));
}

TEST_F(ControlServiceTest, SetColorErrors) {
    control::CommandReply reply;

    control::SetColorRequest missing;
    grpc::Status status = stub_->SetColor(context().get(), missing, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "Color must be a hex string or RGB object");

    control::SetColorRequest badHex;
    badHex.set_hex("#12");
    status = stub_->SetColor(context().get(), badHex, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "Invalid hex color format");

    control::SetColorRequest badRgb;
    badRgb.mutable_rgb()->set_r(300);
    status = stub_->SetColor(context().get(), badRgb, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "RGB values must be between 0 and 255");
}

TEST_F(ControlServiceTest, GetStatusAndPing) {
    control::SetBrightnessRequest brightness;
    brightness.set_brightness(20);
    control::CommandReply commandReply;
    ASSERT_TRUE(stub_->SetBrightness(context().get(), brightness, &commandReply).ok());

    control::DeviceRequest request;
    control::StatusReply statusReply;
    grpc::Status status = stub_->GetStatus(context().get(), request, &statusReply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(statusReply.device().address(), "127.0.0.1");
    EXPECT_EQ(statusReply.device().port(), bulb_->port());
    EXPECT_TRUE(statusReply.status().connected());
    EXPECT_EQ(statusReply.status().brightness(), 20);
    EXPECT_TRUE(statusReply.status().has_temperature());
    EXPECT_EQ(statusReply.status().temperature(), 3000);

    control::PingReply pingReply;
    status = stub_->Ping(context().get(), request, &pingReply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_TRUE(pingReply.reachable());
}

// =============================================================================
// Failure mapping
// =============================================================================

TEST_F(ControlServiceTest, SilentBulbTimesOut) {
    bulb_->setMuted(true);

    control::DeviceRequest request;
    control::CommandReply reply;
    grpc::Status status = stub_->TurnOn(context().get(), request, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_EQ(status.error_message(), "Command timeout");

    // Status queries degrade instead of failing
    control::StatusReply statusReply;
    status = stub_->GetStatus(context().get(), request, &statusReply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_FALSE(statusReply.status().connected());

    control::PingReply pingReply;
    status = stub_->Ping(context().get(), request, &pingReply);
    ASSERT_TRUE(status.ok());
    EXPECT_FALSE(pingReply.reachable());
}

TEST_F(ControlServiceTest, UnknownTargetIsFailedPrecondition) {
    control::DeviceRequest request;
    request.mutable_target()->set_address("127.0.0.1");
    request.mutable_target()->set_port(1);
    control::CommandReply reply;

    grpc::Status status = stub_->TurnOn(context().get(), request, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(status.error_message(), "No connection to bulb at 127.0.0.1:1");

    request.mutable_target()->set_port(70000);
    status = stub_->TurnOn(context().get(), request, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(ControlServiceTest, MissingDefaultDevice) {
    registry_->disconnect("127.0.0.1", bulb_->port());

    control::DeviceRequest request;
    control::CommandReply reply;
    grpc::Status status = stub_->TurnOn(context().get(), request, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(status.error_message(), "No default bulb connection available");
}

// =============================================================================
// Device management
// =============================================================================

TEST_F(ControlServiceTest, DiscoverFindsMockBulb) {
    control::DiscoverRequest request;
    request.set_timeout_ms(300);
    control::DiscoverReply reply;

    grpc::Status status = stub_->DiscoverDevices(context().get(), request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    ASSERT_EQ(reply.devices_size(), 1);
    EXPECT_EQ(reply.devices(0).address(), "127.0.0.1");
    EXPECT_EQ(reply.devices(0).port(), bulb_->port());
    EXPECT_EQ(reply.devices(0).name(), "Living Room");
    EXPECT_EQ(reply.devices(0).mac_address(), "00:11:22:33:44:55");
}

TEST_F(ControlServiceTest, ConnectDriveAndDisconnectSecondBulb) {
    mock::MockBulb second(0, "Bedroom", "127.0.0.1");
    ASSERT_TRUE(second.start());
    const std::string where = "127.0.0.1:" + std::to_string(second.port());

    control::ConnectRequest connect;
    connect.set_address("127.0.0.1");
    connect.set_port(second.port());
    control::CommandReply reply;

    grpc::Status status = stub_->ConnectDevice(context().get(), connect, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(reply.message(), "Successfully connected to bulb at " + where);

    control::SetBrightnessRequest brightness;
    brightness.mutable_target()->set_address("127.0.0.1");
    brightness.mutable_target()->set_port(second.port());
    brightness.set_brightness(5);
    ASSERT_TRUE(stub_->SetBrightness(context().get(), brightness, &reply).ok());
    EXPECT_EQ(second.state().brightness, 5);
    EXPECT_EQ(bulb_->state().brightness, 50);

    control::AllStatusesReply all;
    status = stub_->GetAllStatuses(context().get(), control::AllStatusesRequest(), &all);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(all.statuses_size(), 2);

    status = stub_->DisconnectDevice(context().get(), connect, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(reply.message(), "Disconnected from bulb at " + where);

    status = stub_->DisconnectDevice(context().get(), connect, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);

    status = stub_->SetBrightness(context().get(), brightness, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
}

TEST_F(ControlServiceTest, ConnectRequiresAddressAndPort) {
    control::ConnectRequest request;
    request.set_address("127.0.0.1");
    control::CommandReply reply;

    grpc::Status status = stub_->ConnectDevice(context().get(), request, &reply);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "Both ip and port are required");
}

TEST(ControlServiceStatusTest, ErrorMapping) {
    using services::toGrpcStatus;
    EXPECT_EQ(toGrpcStatus(core::ValidationError("x")).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(toGrpcStatus(core::FormatError("x")).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(toGrpcStatus(core::TimeoutError("x")).error_code(),
              grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_EQ(toGrpcStatus(core::ProtocolError("x")).error_code(),
              grpc::StatusCode::ABORTED);
    EXPECT_EQ(toGrpcStatus(core::TransportError("x")).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(toGrpcStatus(core::ClosedError()).error_code(),
              grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(toGrpcStatus(core::BackpressureError("x")).error_code(),
              grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(toGrpcStatus(core::ProtocolError("Unknown command: x")).error_message(),
              "Unknown command: x");
}
