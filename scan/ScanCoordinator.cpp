#include "ScanCoordinator.hpp"

#include "../common/ThreadSafeQueue.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace netscout::scan
{
    ScanCoordinator::ScanCoordinator(JobRegistry &registry,
                                     Pinger &pinger,
                                     SessionFactory &sessions,
                                     CredentialStore &credentials,
                                     TemplateStore *templates,
                                     ScanLimits limits)
        : m_registry(registry),
          m_credentials(credentials),
          m_templates(templates),
          m_limits(limits),
          m_expander(limits.min_prefix_length, limits.max_networks),
          m_prober(pinger, limits.ping_timeout),
          m_trial(credentials, sessions, limits.login_timeout, limits.login_attempts)
    {
    }

    ScanCoordinator::~ScanCoordinator()
    {
        JoinAll();
    }

    std::shared_ptr<ScanJob> ScanCoordinator::Submit(const ScanRequest &request)
    {
        std::vector<std::string> targets = m_expander.Expand(request.cidrs);

        if (request.credential_ids.empty())
            throw ValidationError("At least one credential ID required");

        std::vector<int> usable;
        for (int id : request.credential_ids)
        {
            if (std::find(usable.begin(), usable.end(), id) != usable.end())
                continue;
            try
            {
                if (m_credentials.IsUsable(id))
                    usable.push_back(id);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Coordinator] Credential " << id << " lookup failed: " << e.what() << "\n";
            }
        }
        if (usable.empty())
            throw ValidationError("No valid credentials");

        auto job = m_registry.Create(static_cast<uint32_t>(targets.size()));
        std::cout << "[Coordinator] Job " << job->Id() << " accepted: " << targets.size() << " target(s), "
                  << usable.size() << " credential(s), mode " << ToString(request.mode) << "\n";

        ReapFinished();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread runner([this, job, targets = std::move(targets), usable = std::move(usable),
                            mode = request.mode, parsers = request.parser_template_ids, done]() mutable
                           {
                               RunJob(job, std::move(targets), std::move(usable), mode, std::move(parsers));
                               done->store(true); });

        std::lock_guard<std::mutex> lock(m_runners_mutex);
        m_runners.push_back(Runner{std::move(runner), done});
        return job;
    }

    void ScanCoordinator::ReapFinished()
    {
        std::lock_guard<std::mutex> lock(m_runners_mutex);
        for (auto it = m_runners.begin(); it != m_runners.end();)
        {
            if (it->done->load())
            {
                if (it->thread.joinable())
                    it->thread.join();
                it = m_runners.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    void ScanCoordinator::JoinAll()
    {
        std::vector<Runner> runners;
        {
            std::lock_guard<std::mutex> lock(m_runners_mutex);
            runners.swap(m_runners);
        }
        for (auto &runner : runners)
        {
            if (runner.thread.joinable())
                runner.thread.join();
        }
    }

    std::vector<TextFsmTemplate> ScanCoordinator::LoadParsers(const std::vector<int> &template_ids)
    {
        std::vector<TextFsmTemplate> parsers;
        if (template_ids.empty())
            return parsers;

        if (!m_templates)
        {
            std::cerr << "[Coordinator] Parser templates requested but no template store configured\n";
            return parsers;
        }

        for (int id : template_ids)
        {
            try
            {
                auto record = m_templates->GetTemplate(id);
                if (!record || record->category != TemplateCategory::Parser)
                {
                    std::cerr << "[Coordinator] Parser template " << id << " not found, skipping\n";
                    continue;
                }
                parsers.push_back(TextFsmTemplate::Parse(record->content));
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Coordinator] Parser template " << id << " unusable: " << e.what() << "\n";
            }
        }
        return parsers;
    }

    void ScanCoordinator::RunJob(std::shared_ptr<ScanJob> job, std::vector<std::string> targets,
                                 std::vector<int> credential_ids, ClassificationMode mode, std::vector<int> parser_ids)
    {
        const PlatformClassifier classifier = PlatformClassifier::ForMode(mode, LoadParsers(parser_ids));

        common::ThreadSafeQueue<std::string> queue;
        for (auto &target : targets)
            queue.Push(std::move(target));
        queue.Shutdown();

        size_t worker_count = std::min(m_limits.max_in_flight, targets.size());
        if (worker_count == 0 && !targets.empty())
            worker_count = 1;

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i)
        {
            workers.emplace_back([this, &queue, &job, &credential_ids, &classifier]
                                 {
                                     while (auto address = queue.Pop())
                                         ProcessHost(*job, *address, credential_ids, classifier); });
        }
        for (auto &worker : workers)
            worker.join();

        job->Finish();

        ScanCounters counters = job->Counters();
        std::cout << "[Coordinator] Job " << job->Id() << " finished: " << counters.alive << "/" << counters.total
                  << " alive, " << counters.authenticated << " authenticated, " << counters.auth_failed
                  << " auth-failed, " << counters.driver_not_supported << " unsupported\n";
    }

    void ScanCoordinator::ProcessHost(ScanJob &job, const std::string &address, const std::vector<int> &credential_ids,
                                      const PlatformClassifier &classifier)
    {
        bool alive = false;
        try
        {
            if (!m_prober.IsAlive(address))
            {
                job.RecordUnreachable();
                return;
            }
            job.RecordAlive();
            alive = true;

            TrialOutcome trial = m_trial.Authenticate(address, credential_ids);
            if (!trial.Succeeded())
            {
                std::cout << "[Coordinator] " << address << " auth-failed after " << trial.attempts << " attempt(s)\n";
                job.RecordAuthFailed(address);
                return;
            }

            ScanResult result;
            result.address = address;
            result.credential_id = trial.credential_id;

            auto classification = classifier.Classify(*trial.session);
            if (classification)
            {
                result.family = classification->family;
                result.hostname = classification->hostname;
                result.platform = classification->platform;
            }
            else
            {
                result.failure = HostFailure::DriverNotSupported;
            }

            job.RecordAuthenticated(std::move(result));
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Coordinator] " << address << " pipeline error: " << e.what() << "\n";
            job.RecordError(address + ": " + e.what());
            if (alive)
                job.RecordAuthFailed(address);
            else
                job.RecordUnreachable();
        }
    }
}
