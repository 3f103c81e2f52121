#pragma once

#include "../onboard/Collaborators.hpp"
#include "HttpClient.hpp"

#include <nlohmann/json.hpp>

namespace netscout::publish
{
    struct NautobotConfig
    {
        std::string url; // base URL, no trailing /api
        std::string token;
        std::string job_name = "Sync Devices From Network";
    };

    // Queues the registration job through the Nautobot REST API. The token is
    // only ever placed in the Authorization header.
    class NautobotRegistrar : public onboard::DeviceRegistrar
    {
    public:
        NautobotRegistrar(NautobotConfig config, HttpClient &http);

        onboard::RegistrationOutcome Register(const onboard::NetworkDeviceRegistration &device) override;

        std::string JobUrl() const;

        static nlohmann::json BuildJobBody(const onboard::NetworkDeviceRegistration &device);
        static onboard::RegistrationOutcome InterpretResponse(const HttpResponse &response);

    private:
        NautobotConfig m_config;
        HttpClient &m_http;
    };

    std::string UrlEncode(const std::string &text);
}
