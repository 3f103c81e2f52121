#pragma once

#include "Collaborators.hpp"
#include "OnboardTypes.hpp"
#include "../scan/Collaborators.hpp"
#include "../scan/JobRegistry.hpp"

#include <optional>
#include <string>

namespace netscout::onboard
{
    // Normalises "detect"/"auto"/blank to absent.
    std::optional<std::string> NormalizePlatform(const std::optional<std::string> &platform);

    // Turns a confirmed subset of a scan's results into registrations for
    // network devices and a rendered inventory artifact for servers.
    class OnboardingDispatcher
    {
    public:
        OnboardingDispatcher(scan::JobRegistry &registry,
                             DeviceRegistrar &registrar,
                             TemplateEngine &templates,
                             ArtifactStore &artifacts,
                             scan::TemplateStore *template_store);

        // nullopt when the job does not exist (or has expired).
        std::optional<OnboardResult> Dispatch(const OnboardRequest &request);

    private:
        struct Candidate
        {
            scan::ScanResult result;
            DeviceMetadata metadata;
        };

        void RegisterNetworkDevices(const std::vector<Candidate> &devices, OnboardResult &out);
        void BuildInventory(const OnboardRequest &request, const std::vector<Candidate> &devices, OnboardResult &out);
        bool ResolveInventoryTemplate(const OnboardRequest &request, std::optional<std::string> &text, OnboardResult &out);

        scan::JobRegistry &m_registry;
        DeviceRegistrar &m_registrar;
        TemplateEngine &m_templates;
        ArtifactStore &m_artifacts;
        scan::TemplateStore *m_template_store;
    };
}
