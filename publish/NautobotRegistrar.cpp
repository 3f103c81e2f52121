#include "NautobotRegistrar.hpp"

#include <cctype>
#include <iostream>

namespace netscout::publish
{
    std::string UrlEncode(const std::string &text)
    {
        static const char hex[] = "0123456789ABCDEF";
        std::string out;
        for (unsigned char c : text)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                out += static_cast<char>(c);
            }
            else
            {
                out += '%';
                out += hex[c >> 4];
                out += hex[c & 0x0F];
            }
        }
        return out;
    }

    NautobotRegistrar::NautobotRegistrar(NautobotConfig config, HttpClient &http)
        : m_config(std::move(config)), m_http(http)
    {
        while (!m_config.url.empty() && m_config.url.back() == '/')
            m_config.url.pop_back();
    }

    std::string NautobotRegistrar::JobUrl() const
    {
        return m_config.url + "/api/extras/jobs/" + UrlEncode(m_config.job_name) + "/run/";
    }

    nlohmann::json NautobotRegistrar::BuildJobBody(const onboard::NetworkDeviceRegistration &device)
    {
        nlohmann::json data = {
            {"location", device.location ? nlohmann::json(*device.location) : nlohmann::json(nullptr)},
            {"ip_addresses", device.address},
            {"secrets_group", device.secrets_group ? nlohmann::json(*device.secrets_group) : nlohmann::json(nullptr)},
            {"device_role", device.role},
            {"namespace", device.namespace_name},
            {"device_status", device.status},
            {"interface_status", device.interface_status},
            {"ip_address_status", device.ip_status},
            {"platform", device.platform ? nlohmann::json(*device.platform) : nlohmann::json(nullptr)},
            {"port", device.port},
            {"timeout", device.timeout_seconds},
            {"update_devices_without_primary_ip", false},
        };
        return nlohmann::json{{"data", data}};
    }

    onboard::RegistrationOutcome NautobotRegistrar::InterpretResponse(const HttpResponse &response)
    {
        onboard::RegistrationOutcome outcome;
        nlohmann::json body = nlohmann::json::parse(response.body, nullptr, false);

        if (response.status == 200 || response.status == 201 || response.status == 202)
        {
            if (body.is_object())
            {
                auto result = body.find("job_result");
                if (result != body.end() && result->is_object() && result->contains("id") && !(*result)["id"].is_null())
                {
                    const auto &id = (*result)["id"];
                    outcome.tracking_id = id.is_string() ? id.get<std::string>() : id.dump();
                }
                else if (body.contains("id") && !body["id"].is_null())
                {
                    const auto &id = body["id"];
                    outcome.tracking_id = id.is_string() ? id.get<std::string>() : id.dump();
                }
            }

            if (outcome.tracking_id.empty())
            {
                outcome.error = "registration accepted without a job id";
                return outcome;
            }
            outcome.accepted = true;
            return outcome;
        }

        std::string detail;
        if (body.is_object())
        {
            if (body.contains("detail"))
                detail = body["detail"].is_string() ? body["detail"].get<std::string>() : body["detail"].dump();
            else if (body.contains("message"))
                detail = body["message"].is_string() ? body["message"].get<std::string>() : body["message"].dump();
            else
                detail = body.dump();
        }
        else if (!response.body.empty())
        {
            detail = response.body;
        }
        else
        {
            detail = "no response body";
        }

        outcome.error = "HTTP " + std::to_string(response.status) + ": " + detail;
        return outcome;
    }

    onboard::RegistrationOutcome NautobotRegistrar::Register(const onboard::NetworkDeviceRegistration &device)
    {
        if (m_config.url.empty() || m_config.token.empty())
        {
            onboard::RegistrationOutcome outcome;
            outcome.error = "registration endpoint is not configured";
            return outcome;
        }

        std::map<std::string, std::string> headers = {
            {"Authorization", "Token " + m_config.token},
            {"Content-Type", "application/json"},
            {"Accept", "application/json"},
        };

        HttpResponse response;
        try
        {
            response = m_http.Post(JobUrl(), headers, BuildJobBody(device).dump());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Nautobot] Request for " << device.address << " failed: " << e.what() << std::endl;
            onboard::RegistrationOutcome outcome;
            outcome.error = e.what();
            return outcome;
        }

        onboard::RegistrationOutcome outcome = InterpretResponse(response);
        if (outcome.accepted)
            std::cout << "[Nautobot] Queued " << device.address << " as job " << outcome.tracking_id << std::endl;
        else
            std::cerr << "[Nautobot] Registration of " << device.address << " refused: " << outcome.error << std::endl;
        return outcome;
    }
}
