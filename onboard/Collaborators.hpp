#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace netscout::onboard
{
    // ---- structured registration ----

    struct NetworkDeviceRegistration
    {
        std::string address;
        std::string hostname;
        std::optional<std::string> location;
        std::string role;
        std::string status;
        std::string namespace_name;
        std::string interface_status;
        std::string ip_status;
        std::optional<std::string> platform; // absent: let the registrar detect it
        std::optional<std::string> secrets_group;
        int port = 22;
        int timeout_seconds = 30;
    };

    struct RegistrationOutcome
    {
        bool accepted = false;
        std::string tracking_id;
        std::string error;
    };

    class DeviceRegistrar
    {
    public:
        virtual ~DeviceRegistrar() = default;
        virtual RegistrationOutcome Register(const NetworkDeviceRegistration &device) = 0;
    };

    // ---- inventory rendering ----

    struct InventoryDevice
    {
        std::string name;
        std::string address;
        int credential_id = 0;
        std::string hostname;
        std::string platform;
        std::string location;
        std::string role;
        std::string status;
        std::string namespace_name;
        std::vector<std::string> tags;
    };

    class TemplateError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class TemplateEngine
    {
    public:
        virtual ~TemplateEngine() = default;

        // No template text selects the built-in inventory layout.
        // Throws TemplateError on a malformed template.
        virtual std::string Render(const std::optional<std::string> &template_text,
                                   const std::vector<InventoryDevice> &devices) = 0;
    };

    // ---- artifacts ----

    struct CommitOutcome
    {
        bool committed = false;
        bool pushed = false;
        std::string error;
    };

    class ArtifactStore
    {
    public:
        virtual ~ArtifactStore() = default;

        // Returns the written path; throws std::runtime_error on I/O failure.
        virtual std::string Write(const std::string &name, const std::string &content) = 0;
        virtual CommitOutcome Commit(const std::vector<std::string> &paths, const std::string &message, bool push) = 0;
    };
}
