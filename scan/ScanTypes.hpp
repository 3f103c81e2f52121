#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace netscout::scan
{
    // Rejected input; raised before any job exists.
    class ValidationError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class ClassificationMode : uint8_t
    {
        Full,  // vendor drivers, then the generic shell probe
        Shell  // generic shell probe only
    };

    enum class DeviceFamily : uint8_t
    {
        NetworkDevice,
        GeneralServer
    };

    enum class HostFailure : uint8_t
    {
        None,
        AuthFailed,
        DriverNotSupported
    };

    enum class JobState : uint8_t
    {
        Running,
        Finished
    };

    struct ScanLimits
    {
        int min_prefix_length = 22;
        size_t max_networks = 10;
        size_t max_in_flight = 10;
        std::chrono::milliseconds ping_timeout{1500};
        std::chrono::milliseconds login_timeout{5000};
        int login_attempts = 3;
        std::chrono::seconds job_ttl{24 * 3600};
    };

    struct ScanRequest
    {
        std::vector<std::string> cidrs;
        std::vector<int> credential_ids;
        ClassificationMode mode = ClassificationMode::Full;
        std::vector<int> parser_template_ids;
    };

    struct ScanResult
    {
        std::string address;
        std::optional<int> credential_id;
        std::optional<DeviceFamily> family;
        std::string hostname;
        std::string platform;
        HostFailure failure = HostFailure::None;

        bool IsOnboardable() const { return failure == HostFailure::None && family.has_value(); }
    };

    struct ScanCounters
    {
        uint32_t total = 0;
        uint32_t scanned = 0;
        uint32_t alive = 0;
        uint32_t authenticated = 0;
        uint32_t unreachable = 0;
        uint32_t auth_failed = 0;
        uint32_t driver_not_supported = 0;
    };

    struct ScanJobSnapshot
    {
        std::string job_id;
        JobState state = JobState::Running;
        int64_t created_unix = 0;
        ScanCounters counters;
        std::vector<ScanResult> results;
        std::vector<std::string> errors;
    };

    struct ScanJobSummary
    {
        std::string job_id;
        JobState state = JobState::Running;
        int64_t created_unix = 0;
        uint32_t total = 0;
        uint32_t authenticated = 0;
    };

    const char *ToString(ClassificationMode mode);
    const char *ToString(DeviceFamily family);
    const char *ToString(HostFailure failure);
    const char *ToString(JobState state);

    std::optional<ClassificationMode> ParseClassificationMode(std::string_view text);
    std::optional<DeviceFamily> ParseDeviceFamily(std::string_view text);
}
