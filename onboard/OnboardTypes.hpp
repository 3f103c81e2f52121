#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netscout::onboard
{
    // Caller-supplied attributes for one selected device. Unset fields fall
    // back to the branch defaults.
    struct DeviceMetadata
    {
        std::optional<std::string> name;
        std::optional<std::string> location;
        std::optional<std::string> role;
        std::optional<std::string> status;
        std::optional<std::string> namespace_name;
        std::optional<std::string> interface_status;
        std::optional<std::string> ip_status;
        std::optional<std::string> platform;
        std::optional<std::string> secrets_group;
        std::vector<std::string> tags;
    };

    struct DeviceSelection
    {
        std::string address;
        DeviceMetadata metadata;
    };

    struct CommitOptions
    {
        bool enabled = false;
        std::optional<std::string> message;
        bool push = false;
    };

    struct OnboardRequest
    {
        std::string job_id;
        std::vector<DeviceSelection> devices;
        std::optional<int> inventory_template_id; // built-in default when unset
        std::optional<std::string> artifact_name;
        CommitOptions commit;
    };

    struct OnboardResult
    {
        uint32_t accepted = 0;
        uint32_t network_queued = 0;
        uint32_t network_failed = 0;
        uint32_t servers_added = 0;
        std::vector<std::string> tracking_ids;
        std::optional<std::string> artifact_path;
        bool committed = false;
        bool pushed = false;
        std::vector<std::string> errors;
    };
}
