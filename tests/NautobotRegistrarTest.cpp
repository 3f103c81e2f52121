#include "publish/HttpClient.hpp"
#include "publish/NautobotRegistrar.hpp"

#include <gtest/gtest.h>

using namespace netscout::publish;
using netscout::onboard::NetworkDeviceRegistration;

namespace
{
    NetworkDeviceRegistration Device()
    {
        NetworkDeviceRegistration device;
        device.address = "10.0.0.1";
        device.hostname = "edge-sw01";
        device.role = "network";
        device.status = "Active";
        device.namespace_name = "Global";
        device.interface_status = "Active";
        device.ip_status = "Active";
        return device;
    }

    HttpResponse Response(int status, const std::string &body)
    {
        HttpResponse response;
        response.status = status;
        response.body = body;
        return response;
    }
}

TEST(NautobotRegistrarTest, JobUrlEncodesJobName)
{
    HttpClient http;
    NautobotRegistrar registrar(NautobotConfig{"https://nautobot.local/", "t0k3n"}, http);

    EXPECT_EQ(registrar.JobUrl(), "https://nautobot.local/api/extras/jobs/Sync%20Devices%20From%20Network/run/");
    EXPECT_EQ(UrlEncode("a/b c~d"), "a%2Fb%20c~d");
}

TEST(NautobotRegistrarTest, JobBodyUsesNullForAbsentFields)
{
    auto body = NautobotRegistrar::BuildJobBody(Device());
    const auto &data = body.at("data");

    EXPECT_EQ(data.at("ip_addresses"), "10.0.0.1");
    EXPECT_TRUE(data.at("location").is_null());
    EXPECT_TRUE(data.at("secrets_group").is_null());
    EXPECT_TRUE(data.at("platform").is_null());
    EXPECT_EQ(data.at("device_role"), "network");
    EXPECT_EQ(data.at("namespace"), "Global");
    EXPECT_EQ(data.at("device_status"), "Active");
    EXPECT_EQ(data.at("interface_status"), "Active");
    EXPECT_EQ(data.at("ip_address_status"), "Active");
    EXPECT_EQ(data.at("port"), 22);
    EXPECT_EQ(data.at("timeout"), 30);
    EXPECT_EQ(data.at("update_devices_without_primary_ip"), false);
}

TEST(NautobotRegistrarTest, JobBodyCarriesProvidedFields)
{
    auto device = Device();
    device.location = "DC1";
    device.platform = "cisco_ios";
    device.secrets_group = "ssh-admins";

    const auto data = NautobotRegistrar::BuildJobBody(device).at("data");
    EXPECT_EQ(data.at("location"), "DC1");
    EXPECT_EQ(data.at("platform"), "cisco_ios");
    EXPECT_EQ(data.at("secrets_group"), "ssh-admins");
}

TEST(NautobotRegistrarTest, SuccessfulResponsesYieldTrackingIds)
{
    auto nested = NautobotRegistrar::InterpretResponse(Response(201, R"({"job_result": {"id": "8f1c"}})"));
    EXPECT_TRUE(nested.accepted);
    EXPECT_EQ(nested.tracking_id, "8f1c");

    auto flat = NautobotRegistrar::InterpretResponse(Response(200, R"({"id": 42})"));
    EXPECT_TRUE(flat.accepted);
    EXPECT_EQ(flat.tracking_id, "42");

    auto no_id = NautobotRegistrar::InterpretResponse(Response(202, R"({"job_result": null})"));
    EXPECT_FALSE(no_id.accepted);
    EXPECT_EQ(no_id.error, "registration accepted without a job id");
}

TEST(NautobotRegistrarTest, FailedResponsesDescribeTheProblem)
{
    EXPECT_EQ(NautobotRegistrar::InterpretResponse(Response(403, R"({"detail": "Invalid token."})")).error,
              "HTTP 403: Invalid token.");
    EXPECT_EQ(NautobotRegistrar::InterpretResponse(Response(400, R"({"message": "bad location"})")).error,
              "HTTP 400: bad location");
    EXPECT_EQ(NautobotRegistrar::InterpretResponse(Response(400, R"({"location": ["required"]})")).error,
              R"(HTTP 400: {"location":["required"]})");
    EXPECT_EQ(NautobotRegistrar::InterpretResponse(Response(502, "Bad Gateway")).error, "HTTP 502: Bad Gateway");
    EXPECT_EQ(NautobotRegistrar::InterpretResponse(Response(500, "")).error, "HTTP 500: no response body");
}

TEST(NautobotRegistrarTest, UnconfiguredEndpointFailsWithoutNetwork)
{
    HttpClient http;
    NautobotRegistrar registrar(NautobotConfig{"", ""}, http);

    auto outcome = registrar.Register(Device());
    EXPECT_FALSE(outcome.accepted);
    EXPECT_EQ(outcome.error, "registration endpoint is not configured");
}

TEST(NautobotRegistrarTest, TransportFailureIsReportedNotThrown)
{
    HttpClient http(std::chrono::milliseconds(500));
    NautobotRegistrar registrar(NautobotConfig{"http://127.0.0.1:1", "t0k3n"}, http);

    auto outcome = registrar.Register(Device());
    EXPECT_FALSE(outcome.accepted);
    EXPECT_FALSE(outcome.error.empty());
    EXPECT_EQ(outcome.error.find("t0k3n"), std::string::npos);
}
