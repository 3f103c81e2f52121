#pragma once

#include "Collaborators.hpp"
#include "ScanTypes.hpp"
#include "TextFsm.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netscout::scan
{
    struct Classification
    {
        DeviceFamily family = DeviceFamily::NetworkDevice;
        std::string hostname;
        std::string platform;
    };

    // One step of the ordered driver fallback. A miss returns nullopt.
    class ClassifierStrategy
    {
    public:
        virtual ~ClassifierStrategy() = default;

        virtual const std::string &Name() const = 0;
        virtual std::optional<Classification> Probe(DeviceSession &session) const = 0;
    };

    struct VendorProfile
    {
        std::string driver;
        std::string facts_command;
        std::vector<std::string> signatures; // any one must appear
        std::vector<std::string> excludes;   // none may appear
        std::string hostname_command;        // empty: parse it from the facts output
    };

    class VendorDriverProbe : public ClassifierStrategy
    {
    public:
        VendorDriverProbe(VendorProfile profile, std::chrono::milliseconds command_timeout);

        const std::string &Name() const override { return m_profile.driver; }
        std::optional<Classification> Probe(DeviceSession &session) const override;

        static VendorProfile Ios();
        static VendorProfile NxosSsh();
        static VendorProfile IosXr();

    private:
        VendorProfile m_profile;
        std::chrono::milliseconds m_timeout;
    };

    // Generic shell fallback: "show version" for network gear, then
    // hostname/uname for servers. Parser templates refine field extraction.
    class ShellProbe : public ClassifierStrategy
    {
    public:
        ShellProbe(std::vector<TextFsmTemplate> parsers, std::chrono::milliseconds command_timeout);

        const std::string &Name() const override { return m_name; }
        std::optional<Classification> Probe(DeviceSession &session) const override;

    private:
        struct ParsedFields
        {
            std::string hostname;
            std::string platform;
        };

        ParsedFields ApplyParsers(const std::string &output) const;

        std::string m_name = "shell";
        std::vector<TextFsmTemplate> m_parsers;
        std::chrono::milliseconds m_timeout;
    };

    class PlatformClassifier
    {
    public:
        explicit PlatformClassifier(std::vector<std::unique_ptr<ClassifierStrategy>> strategies);

        // Full: ios, nxos_ssh, iosxr, shell. Shell: shell only.
        static PlatformClassifier ForMode(ClassificationMode mode, std::vector<TextFsmTemplate> parsers,
                                          std::chrono::milliseconds command_timeout = std::chrono::seconds(30));

        // nullopt when no strategy recognises the device.
        std::optional<Classification> Classify(DeviceSession &session) const;

        size_t StrategyCount() const { return m_strategies.size(); }

    private:
        std::vector<std::unique_ptr<ClassifierStrategy>> m_strategies;
    };

    // Heuristic hostname extraction from "show version"-style output.
    std::string ExtractNetworkHostname(const std::string &output);
}
