#include "OnboardingDispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

namespace netscout::onboard
{
    namespace
    {
        std::string ValueOr(const std::optional<std::string> &value, const std::string &fallback)
        {
            return value && !value->empty() ? *value : fallback;
        }

        bool IsSafeArtifactName(const std::string &name)
        {
            return !name.empty() && name.find('/') == std::string::npos && name.find("..") == std::string::npos;
        }
    }

    std::optional<std::string> NormalizePlatform(const std::optional<std::string> &platform)
    {
        if (!platform)
            return std::nullopt;

        std::string lowered;
        for (char c : *platform)
        {
            if (!std::isspace(static_cast<unsigned char>(c)))
                lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lowered.empty() || lowered == "detect" || lowered == "auto")
            return std::nullopt;
        return platform;
    }

    OnboardingDispatcher::OnboardingDispatcher(scan::JobRegistry &registry,
                                               DeviceRegistrar &registrar,
                                               TemplateEngine &templates,
                                               ArtifactStore &artifacts,
                                               scan::TemplateStore *template_store)
        : m_registry(registry),
          m_registrar(registrar),
          m_templates(templates),
          m_artifacts(artifacts),
          m_template_store(template_store)
    {
    }

    std::optional<OnboardResult> OnboardingDispatcher::Dispatch(const OnboardRequest &request)
    {
        auto snapshot = m_registry.Snapshot(request.job_id);
        if (!snapshot)
            return std::nullopt;

        std::unordered_map<std::string, const scan::ScanResult *> eligible;
        for (const auto &result : snapshot->results)
        {
            if (result.IsOnboardable())
                eligible.emplace(result.address, &result);
        }

        std::vector<Candidate> network_devices;
        std::vector<Candidate> servers;
        std::unordered_set<std::string> taken;

        for (const auto &selection : request.devices)
        {
            auto it = eligible.find(selection.address);
            if (it == eligible.end() || !taken.insert(selection.address).second)
                continue;

            Candidate candidate{*it->second, selection.metadata};
            candidate.metadata.platform = NormalizePlatform(candidate.metadata.platform);

            if (*candidate.result.family == scan::DeviceFamily::NetworkDevice)
                network_devices.push_back(std::move(candidate));
            else
                servers.push_back(std::move(candidate));
        }

        OnboardResult out;
        out.accepted = static_cast<uint32_t>(network_devices.size() + servers.size());

        if (out.accepted == 0)
        {
            out.errors.push_back("No valid devices selected for onboarding");
            std::cout << "[Onboard] Job " << request.job_id << ": no valid devices in selection of "
                      << request.devices.size() << "\n";
            return out;
        }

        std::cout << "[Onboard] Job " << request.job_id << ": " << network_devices.size() << " network device(s), "
                  << servers.size() << " server(s)\n";

        if (!network_devices.empty())
            RegisterNetworkDevices(network_devices, out);
        if (!servers.empty())
            BuildInventory(request, servers, out);

        return out;
    }

    void OnboardingDispatcher::RegisterNetworkDevices(const std::vector<Candidate> &devices, OnboardResult &out)
    {
        for (const auto &device : devices)
        {
            const auto &meta = device.metadata;

            NetworkDeviceRegistration registration;
            registration.address = device.result.address;
            registration.hostname = ValueOr(meta.name, ValueOr(device.result.hostname, device.result.address));
            registration.location = meta.location;
            registration.role = ValueOr(meta.role, "network");
            registration.status = ValueOr(meta.status, "Active");
            registration.namespace_name = ValueOr(meta.namespace_name, "Global");
            registration.interface_status = ValueOr(meta.interface_status, "Active");
            registration.ip_status = ValueOr(meta.ip_status, "Active");
            registration.platform = meta.platform;
            registration.secrets_group = meta.secrets_group;

            RegistrationOutcome outcome;
            try
            {
                outcome = m_registrar.Register(registration);
            }
            catch (const std::exception &e)
            {
                outcome.accepted = false;
                outcome.error = e.what();
            }

            if (outcome.accepted && !outcome.tracking_id.empty())
            {
                ++out.network_queued;
                out.tracking_ids.push_back(outcome.tracking_id);
                std::cout << "[Onboard] " << registration.address << " queued as " << outcome.tracking_id << "\n";
                continue;
            }

            ++out.network_failed;
            std::string reason = outcome.error.empty() ? "registration returned no tracking id" : outcome.error;
            out.errors.push_back(registration.address + ": " + reason);
            std::cerr << "[Onboard] " << registration.address << " registration failed: " << reason << "\n";
        }
    }

    bool OnboardingDispatcher::ResolveInventoryTemplate(const OnboardRequest &request, std::optional<std::string> &text,
                                                        OnboardResult &out)
    {
        text.reset();
        if (!request.inventory_template_id)
            return true;

        int id = *request.inventory_template_id;
        if (!m_template_store)
        {
            out.errors.push_back("Inventory template " + std::to_string(id) + " requested but no template store is configured");
            return false;
        }

        std::optional<scan::TemplateRecord> record;
        try
        {
            record = m_template_store->GetTemplate(id);
        }
        catch (const std::exception &e)
        {
            out.errors.push_back("Inventory template " + std::to_string(id) + " could not be loaded: " + e.what());
            return false;
        }

        if (!record || record->category != scan::TemplateCategory::Inventory)
        {
            out.errors.push_back("Inventory template " + std::to_string(id) + " not found");
            return false;
        }

        text = record->content;
        return true;
    }

    void OnboardingDispatcher::BuildInventory(const OnboardRequest &request, const std::vector<Candidate> &devices,
                                              OnboardResult &out)
    {
        std::vector<InventoryDevice> inventory;
        inventory.reserve(devices.size());
        for (const auto &device : devices)
        {
            const auto &meta = device.metadata;

            InventoryDevice entry;
            entry.address = device.result.address;
            entry.credential_id = device.result.credential_id.value_or(0);
            entry.hostname = ValueOr(device.result.hostname, device.result.address);
            entry.name = ValueOr(meta.name, entry.hostname);
            entry.platform = ValueOr(meta.platform, ValueOr(device.result.platform, "linux"));
            entry.location = meta.location.value_or("");
            entry.role = ValueOr(meta.role, "server");
            entry.status = ValueOr(meta.status, "Active");
            entry.namespace_name = ValueOr(meta.namespace_name, "Global");
            entry.tags = meta.tags;
            inventory.push_back(std::move(entry));
        }

        std::optional<std::string> template_text;
        if (!ResolveInventoryTemplate(request, template_text, out))
            return;

        std::string rendered;
        try
        {
            rendered = m_templates.Render(template_text, inventory);
        }
        catch (const std::exception &e)
        {
            out.errors.push_back(std::string("Inventory rendering failed: ") + e.what());
            std::cerr << "[Onboard] Inventory rendering for job " << request.job_id << " failed: " << e.what() << "\n";
            return;
        }

        std::string name = request.artifact_name.value_or("inventory_" + request.job_id + ".yaml");
        if (!IsSafeArtifactName(name))
        {
            out.errors.push_back("Invalid artifact name: " + name);
            return;
        }

        std::string path;
        try
        {
            path = m_artifacts.Write(name, rendered);
        }
        catch (const std::exception &e)
        {
            out.errors.push_back(std::string("Writing inventory failed: ") + e.what());
            std::cerr << "[Onboard] Writing " << name << " failed: " << e.what() << "\n";
            return;
        }

        out.artifact_path = path;
        out.servers_added = static_cast<uint32_t>(inventory.size());
        std::cout << "[Onboard] Wrote " << path << " with " << inventory.size() << " server(s)\n";

        if (!request.commit.enabled)
            return;

        std::string message = ValueOr(request.commit.message, "Add inventory for scan " + request.job_id);
        CommitOutcome commit;
        try
        {
            commit = m_artifacts.Commit({path}, message, request.commit.push);
        }
        catch (const std::exception &e)
        {
            commit.error = e.what();
        }

        out.committed = commit.committed;
        out.pushed = commit.pushed;
        if (!commit.error.empty())
        {
            out.errors.push_back("Commit failed: " + commit.error);
            std::cerr << "[Onboard] Commit of " << path << " failed: " << commit.error << "\n";
        }
    }
}
