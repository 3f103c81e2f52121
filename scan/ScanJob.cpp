#include "ScanJob.hpp"

namespace netscout::scan
{
    ScanJob::ScanJob(std::string job_id, std::chrono::system_clock::time_point created, uint32_t total_targets)
        : m_id(std::move(job_id)), m_created(created)
    {
        m_counters.total = total_targets;
    }

    void ScanJob::RecordUnreachable()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_counters.scanned;
        ++m_counters.unreachable;
    }

    void ScanJob::RecordAlive()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_counters.scanned;
        ++m_counters.alive;
    }

    void ScanJob::RecordAuthFailed(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_counters.auth_failed;
        if (!TrackAddress(address))
            return;

        ScanResult result;
        result.address = address;
        result.failure = HostFailure::AuthFailed;
        m_results.push_back(std::move(result));
    }

    void ScanJob::RecordAuthenticated(ScanResult result)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_counters.authenticated;
        if (result.failure == HostFailure::DriverNotSupported)
            ++m_counters.driver_not_supported;
        if (!TrackAddress(result.address))
            return;

        m_results.push_back(std::move(result));
    }

    void ScanJob::RecordError(const std::string &message)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errors.push_back(message);
    }

    void ScanJob::Finish()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = JobState::Finished;
    }

    JobState ScanJob::State() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    ScanCounters ScanJob::Counters() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_counters;
    }

    ScanJobSnapshot ScanJob::Snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ScanJobSnapshot snapshot;
        snapshot.job_id = m_id;
        snapshot.state = m_state;
        snapshot.created_unix = std::chrono::duration_cast<std::chrono::seconds>(m_created.time_since_epoch()).count();
        snapshot.counters = m_counters;
        snapshot.results = m_results;
        snapshot.errors = m_errors;
        return snapshot;
    }

    ScanJobSummary ScanJob::Summary() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ScanJobSummary summary;
        summary.job_id = m_id;
        summary.state = m_state;
        summary.created_unix = std::chrono::duration_cast<std::chrono::seconds>(m_created.time_since_epoch()).count();
        summary.total = m_counters.total;
        summary.authenticated = m_counters.authenticated;
        return summary;
    }

    // Caller holds m_mutex.
    bool ScanJob::TrackAddress(const std::string &address)
    {
        return m_seen.insert(address).second;
    }
}
