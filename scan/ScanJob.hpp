#pragma once

#include "ScanTypes.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace netscout::scan
{
    // Synchronized accumulator for one job. Workers record outcomes through
    // it; readers only ever get copies.
    class ScanJob
    {
    public:
        ScanJob(std::string job_id, std::chrono::system_clock::time_point created, uint32_t total_targets);

        const std::string &Id() const { return m_id; }
        std::chrono::system_clock::time_point Created() const { return m_created; }

        void RecordUnreachable();
        void RecordAlive();
        void RecordAuthFailed(const std::string &address);

        // Authenticated host, classified or flagged driver-not-supported.
        void RecordAuthenticated(ScanResult result);

        void RecordError(const std::string &message);
        void Finish();

        JobState State() const;
        ScanCounters Counters() const;
        ScanJobSnapshot Snapshot() const;
        ScanJobSummary Summary() const;

    private:
        bool TrackAddress(const std::string &address);

        const std::string m_id;
        const std::chrono::system_clock::time_point m_created;

        mutable std::mutex m_mutex;
        JobState m_state = JobState::Running;
        ScanCounters m_counters;
        std::vector<ScanResult> m_results;
        std::vector<std::string> m_errors;
        std::unordered_set<std::string> m_seen;
    };
}
