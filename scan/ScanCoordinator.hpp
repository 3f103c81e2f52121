#pragma once

#include "Collaborators.hpp"
#include "CredentialTrial.hpp"
#include "JobRegistry.hpp"
#include "PlatformClassifier.hpp"
#include "ReachabilityProber.hpp"
#include "ScanTypes.hpp"
#include "TargetExpander.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace netscout::scan
{
    // Validates scan requests, registers jobs and runs each job's host
    // pipelines on a bounded worker set off the caller's thread.
    class ScanCoordinator
    {
    public:
        ScanCoordinator(JobRegistry &registry,
                        Pinger &pinger,
                        SessionFactory &sessions,
                        CredentialStore &credentials,
                        TemplateStore *templates,
                        ScanLimits limits);
        ~ScanCoordinator();

        ScanCoordinator(const ScanCoordinator &) = delete;
        ScanCoordinator &operator=(const ScanCoordinator &) = delete;

        // Throws ValidationError; returns once the job is registered.
        std::shared_ptr<ScanJob> Submit(const ScanRequest &request);

        // Blocks until every job started so far has finished.
        void JoinAll();

        const ScanLimits &Limits() const { return m_limits; }

    private:
        struct Runner
        {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        void RunJob(std::shared_ptr<ScanJob> job, std::vector<std::string> targets,
                    std::vector<int> credential_ids, ClassificationMode mode, std::vector<int> parser_ids);
        void ProcessHost(ScanJob &job, const std::string &address, const std::vector<int> &credential_ids,
                         const PlatformClassifier &classifier);
        std::vector<TextFsmTemplate> LoadParsers(const std::vector<int> &template_ids);
        void ReapFinished();

        JobRegistry &m_registry;
        CredentialStore &m_credentials;
        TemplateStore *m_templates;
        const ScanLimits m_limits;

        TargetExpander m_expander;
        ReachabilityProber m_prober;
        CredentialTrialEngine m_trial;

        std::mutex m_runners_mutex;
        std::vector<Runner> m_runners;
    };
}
