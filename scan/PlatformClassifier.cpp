#include "PlatformClassifier.hpp"

#include <cctype>
#include <exception>
#include <iostream>
#include <sstream>

namespace netscout::scan
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            size_t start = 0;
            while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
                ++start;
            size_t end = s.size();
            while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
                --end;
            return s.substr(start, end - start);
        }

        std::string FirstLine(const std::string &s)
        {
            std::string trimmed = Trim(s);
            auto nl = trimmed.find('\n');
            return Trim(nl == std::string::npos ? trimmed : trimmed.substr(0, nl));
        }

        bool Contains(const std::string &haystack, const std::string &needle)
        {
            return haystack.find(needle) != std::string::npos;
        }

        // Channel failures count as a failed command here; the probe decides.
        CommandResult RunQuietly(DeviceSession &session, const std::string &command, std::chrono::milliseconds timeout)
        {
            try
            {
                return session.Execute(command, timeout);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Classifier] " << session.Address() << " '" << command << "' failed: " << e.what() << "\n";
                return CommandResult{};
            }
        }
    }

    std::string ExtractNetworkHostname(const std::string &output)
    {
        std::istringstream in(output);
        std::string line;
        while (std::getline(in, line))
        {
            line = Trim(line);

            auto uptime = line.find(" uptime is ");
            if (uptime != std::string::npos)
            {
                std::string before = Trim(line.substr(0, uptime));
                auto space = before.rfind(' ');
                std::string name = space == std::string::npos ? before : before.substr(space + 1);
                if (!name.empty())
                    return name;
            }

            if (line.rfind("hostname ", 0) == 0)
                return Trim(line.substr(9));

            if (line.rfind("Device name:", 0) == 0)
                return Trim(line.substr(12));
        }
        return {};
    }

    // ---- vendor drivers ----

    VendorDriverProbe::VendorDriverProbe(VendorProfile profile, std::chrono::milliseconds command_timeout)
        : m_profile(std::move(profile)), m_timeout(command_timeout)
    {
    }

    VendorProfile VendorDriverProbe::Ios()
    {
        return VendorProfile{"ios",
                             "show version",
                             {"Cisco IOS Software", "IOS (tm)", "Cisco Internetwork Operating System"},
                             {"NX-OS", "IOS XR", "IOS-XR"},
                             ""};
    }

    VendorProfile VendorDriverProbe::NxosSsh()
    {
        return VendorProfile{"nxos_ssh",
                             "show version",
                             {"NX-OS", "Nexus Operating System"},
                             {},
                             "show hostname"};
    }

    VendorProfile VendorDriverProbe::IosXr()
    {
        return VendorProfile{"iosxr",
                             "show version",
                             {"IOS XR", "IOS-XR"},
                             {},
                             ""};
    }

    std::optional<Classification> VendorDriverProbe::Probe(DeviceSession &session) const
    {
        CommandResult facts = session.Execute(m_profile.facts_command, m_timeout);
        if (!facts.Succeeded() || Trim(facts.out).empty())
            return std::nullopt;

        for (const auto &exclude : m_profile.excludes)
        {
            if (Contains(facts.out, exclude))
                return std::nullopt;
        }

        bool matched = false;
        for (const auto &signature : m_profile.signatures)
        {
            if (Contains(facts.out, signature))
            {
                matched = true;
                break;
            }
        }
        if (!matched)
            return std::nullopt;

        Classification result;
        result.family = DeviceFamily::NetworkDevice;
        result.platform = m_profile.driver;

        if (!m_profile.hostname_command.empty())
        {
            CommandResult host = session.Execute(m_profile.hostname_command, m_timeout);
            if (host.Succeeded())
                result.hostname = FirstLine(host.out);
        }
        if (result.hostname.empty())
            result.hostname = ExtractNetworkHostname(facts.out);
        if (result.hostname.empty())
            result.hostname = session.Address();

        return result;
    }

    // ---- shell fallback ----

    ShellProbe::ShellProbe(std::vector<TextFsmTemplate> parsers, std::chrono::milliseconds command_timeout)
        : m_parsers(std::move(parsers)), m_timeout(command_timeout)
    {
    }

    ShellProbe::ParsedFields ShellProbe::ApplyParsers(const std::string &output) const
    {
        static const char *HOSTNAME_KEYS[] = {"hostname", "host", "device"};
        static const char *PLATFORM_KEYS[] = {"platform", "version", "os"};

        ParsedFields fields;
        for (const auto &parser : m_parsers)
        {
            std::vector<TextFsmTemplate::Record> records;
            try
            {
                records = parser.ParseRecords(output);
            }
            catch (const TextFsmError &)
            {
                continue;
            }

            for (const auto &record : records)
            {
                for (const char *key : HOSTNAME_KEYS)
                {
                    auto it = record.find(key);
                    if (fields.hostname.empty() && it != record.end() && !it->second.empty())
                        fields.hostname = it->second;
                }
                for (const char *key : PLATFORM_KEYS)
                {
                    auto it = record.find(key);
                    if (fields.platform.empty() && it != record.end() && !it->second.empty())
                        fields.platform = it->second;
                }
            }

            if (!fields.hostname.empty() && !fields.platform.empty())
                break;
        }
        return fields;
    }

    std::optional<Classification> ShellProbe::Probe(DeviceSession &session) const
    {
        CommandResult version = RunQuietly(session, "show version", m_timeout);
        if (version.Succeeded() && Trim(version.out).size() > 50 && Trim(version.err).empty())
        {
            ParsedFields parsed = ApplyParsers(version.out);

            Classification result;
            result.family = DeviceFamily::NetworkDevice;
            result.hostname = !parsed.hostname.empty() ? parsed.hostname : ExtractNetworkHostname(version.out);
            if (result.hostname.empty())
                result.hostname = session.Address();
            result.platform = !parsed.platform.empty() ? parsed.platform : "cisco-unknown";
            return result;
        }

        CommandResult host = RunQuietly(session, "hostname", m_timeout);
        std::string hostname = host.Succeeded() ? FirstLine(host.out) : std::string();
        if (hostname.empty())
            return std::nullopt;

        CommandResult uname = RunQuietly(session, "uname -a", m_timeout);
        std::string platform = uname.Succeeded() ? FirstLine(uname.out) : std::string();

        Classification result;
        result.family = DeviceFamily::GeneralServer;
        result.hostname = hostname;
        result.platform = platform.empty() ? "linux-unknown" : platform;
        return result;
    }

    // ---- classifier ----

    PlatformClassifier::PlatformClassifier(std::vector<std::unique_ptr<ClassifierStrategy>> strategies)
        : m_strategies(std::move(strategies))
    {
    }

    PlatformClassifier PlatformClassifier::ForMode(ClassificationMode mode, std::vector<TextFsmTemplate> parsers,
                                                   std::chrono::milliseconds command_timeout)
    {
        std::vector<std::unique_ptr<ClassifierStrategy>> strategies;
        if (mode == ClassificationMode::Full)
        {
            strategies.push_back(std::make_unique<VendorDriverProbe>(VendorDriverProbe::Ios(), command_timeout));
            strategies.push_back(std::make_unique<VendorDriverProbe>(VendorDriverProbe::NxosSsh(), command_timeout));
            strategies.push_back(std::make_unique<VendorDriverProbe>(VendorDriverProbe::IosXr(), command_timeout));
        }
        strategies.push_back(std::make_unique<ShellProbe>(std::move(parsers), command_timeout));
        return PlatformClassifier(std::move(strategies));
    }

    std::optional<Classification> PlatformClassifier::Classify(DeviceSession &session) const
    {
        for (const auto &strategy : m_strategies)
        {
            try
            {
                auto hit = strategy->Probe(session);
                if (hit)
                {
                    std::cout << "[Classifier] " << session.Address() << " matched " << strategy->Name()
                              << " (" << ToString(hit->family) << ", " << hit->platform << ")\n";
                    return hit;
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Classifier] " << session.Address() << " " << strategy->Name()
                          << " probe failed: " << e.what() << "\n";
            }
        }

        std::cout << "[Classifier] " << session.Address() << " not recognised by any driver\n";
        return std::nullopt;
    }
}
