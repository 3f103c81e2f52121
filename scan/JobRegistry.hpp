#pragma once

#include "ScanJob.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace netscout::scan
{
    // Process-wide store of scan jobs with a fixed retention window.
    // Expired jobs are purged by a background sweep and on every lookup.
    class JobRegistry
    {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        explicit JobRegistry(std::chrono::seconds ttl,
                             Clock clock = nullptr,
                             std::chrono::milliseconds sweep_interval = std::chrono::seconds(60));
        ~JobRegistry();

        JobRegistry(const JobRegistry &) = delete;
        JobRegistry &operator=(const JobRegistry &) = delete;

        void Start();
        void Stop();

        std::shared_ptr<ScanJob> Create(uint32_t total_targets);

        // nullptr when unknown or expired.
        std::shared_ptr<ScanJob> Find(const std::string &job_id);
        std::optional<ScanJobSnapshot> Snapshot(const std::string &job_id);

        // Oldest first.
        std::vector<ScanJobSummary> List();
        bool Remove(const std::string &job_id);

        size_t PurgeExpired();
        size_t Size() const;

    private:
        std::string NextJobId(std::chrono::system_clock::time_point now);
        size_t PurgeLocked(std::chrono::system_clock::time_point now);
        void SweepLoop();

        const std::chrono::seconds m_ttl;
        Clock m_clock;
        const std::chrono::milliseconds m_sweep_interval;

        mutable std::mutex m_mutex;
        std::unordered_map<std::string, std::shared_ptr<ScanJob>> m_jobs;
        std::atomic<uint64_t> m_sequence{0};

        std::mutex m_sweep_mutex;
        std::condition_variable m_sweep_cv;
        bool m_stop = false;
        std::thread m_sweeper;
    };
}
