#include "JobRegistry.hpp"

#include <algorithm>
#include <iostream>

namespace netscout::scan
{
    JobRegistry::JobRegistry(std::chrono::seconds ttl, Clock clock, std::chrono::milliseconds sweep_interval)
        : m_ttl(ttl),
          m_clock(clock ? std::move(clock) : Clock([]
                                                   { return std::chrono::system_clock::now(); })),
          m_sweep_interval(sweep_interval)
    {
    }

    JobRegistry::~JobRegistry()
    {
        Stop();
    }

    void JobRegistry::Start()
    {
        std::lock_guard<std::mutex> lock(m_sweep_mutex);
        if (m_sweeper.joinable())
            return;
        m_stop = false;
        m_sweeper = std::thread(&JobRegistry::SweepLoop, this);
    }

    void JobRegistry::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_sweep_mutex);
            m_stop = true;
        }
        m_sweep_cv.notify_all();
        if (m_sweeper.joinable())
            m_sweeper.join();
    }

    void JobRegistry::SweepLoop()
    {
        std::unique_lock<std::mutex> lock(m_sweep_mutex);
        while (!m_stop)
        {
            if (m_sweep_cv.wait_for(lock, m_sweep_interval, [this]
                                    { return m_stop; }))
                break;

            lock.unlock();
            size_t purged = PurgeExpired();
            if (purged > 0)
                std::cout << "[Registry] Purged " << purged << " expired job(s)\n";
            lock.lock();
        }
    }

    std::string JobRegistry::NextJobId(std::chrono::system_clock::time_point now)
    {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        return "scan_" + std::to_string(ms) + "_" + std::to_string(++m_sequence);
    }

    std::shared_ptr<ScanJob> JobRegistry::Create(uint32_t total_targets)
    {
        auto now = m_clock();
        auto job = std::make_shared<ScanJob>(NextJobId(now), now, total_targets);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_jobs[job->Id()] = job;
        return job;
    }

    size_t JobRegistry::PurgeLocked(std::chrono::system_clock::time_point now)
    {
        size_t purged = 0;
        for (auto it = m_jobs.begin(); it != m_jobs.end();)
        {
            if (now - it->second->Created() >= m_ttl)
            {
                it = m_jobs.erase(it);
                ++purged;
            }
            else
            {
                ++it;
            }
        }
        return purged;
    }

    size_t JobRegistry::PurgeExpired()
    {
        auto now = m_clock();
        std::lock_guard<std::mutex> lock(m_mutex);
        return PurgeLocked(now);
    }

    std::shared_ptr<ScanJob> JobRegistry::Find(const std::string &job_id)
    {
        auto now = m_clock();
        std::lock_guard<std::mutex> lock(m_mutex);
        PurgeLocked(now);

        auto it = m_jobs.find(job_id);
        if (it == m_jobs.end())
            return nullptr;
        return it->second;
    }

    std::optional<ScanJobSnapshot> JobRegistry::Snapshot(const std::string &job_id)
    {
        auto job = Find(job_id);
        if (!job)
            return std::nullopt;
        return job->Snapshot();
    }

    std::vector<ScanJobSummary> JobRegistry::List()
    {
        auto now = m_clock();
        std::vector<std::shared_ptr<ScanJob>> jobs;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            PurgeLocked(now);
            jobs.reserve(m_jobs.size());
            for (const auto &entry : m_jobs)
                jobs.push_back(entry.second);
        }

        std::sort(jobs.begin(), jobs.end(), [](const auto &a, const auto &b)
                  {
                      if (a->Created() != b->Created())
                          return a->Created() < b->Created();
                      return a->Id() < b->Id(); });

        std::vector<ScanJobSummary> summaries;
        summaries.reserve(jobs.size());
        for (const auto &job : jobs)
            summaries.push_back(job->Summary());
        return summaries;
    }

    bool JobRegistry::Remove(const std::string &job_id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_jobs.erase(job_id) > 0;
    }

    size_t JobRegistry::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_jobs.size();
    }
}
