#include "ScanTypes.hpp"

namespace netscout::scan
{
    const char *ToString(ClassificationMode mode)
    {
        return mode == ClassificationMode::Full ? "full" : "shell";
    }

    const char *ToString(DeviceFamily family)
    {
        return family == DeviceFamily::NetworkDevice ? "network-device" : "general-server";
    }

    const char *ToString(HostFailure failure)
    {
        switch (failure)
        {
        case HostFailure::AuthFailed:
            return "auth-failed";
        case HostFailure::DriverNotSupported:
            return "driver-not-supported";
        default:
            return "";
        }
    }

    const char *ToString(JobState state)
    {
        return state == JobState::Running ? "running" : "finished";
    }

    std::optional<ClassificationMode> ParseClassificationMode(std::string_view text)
    {
        // "napalm" and "ssh-login" are the names older callers use
        if (text == "full" || text == "napalm")
            return ClassificationMode::Full;
        if (text == "shell" || text == "ssh-login")
            return ClassificationMode::Shell;
        return std::nullopt;
    }

    std::optional<DeviceFamily> ParseDeviceFamily(std::string_view text)
    {
        if (text == "network-device")
            return DeviceFamily::NetworkDevice;
        if (text == "general-server")
            return DeviceFamily::GeneralServer;
        return std::nullopt;
    }
}
