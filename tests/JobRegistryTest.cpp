#include "scan/JobRegistry.hpp"

#include <gtest/gtest.h>

#include <regex>

using namespace netscout::scan;

namespace
{
    // Manually advanced clock shared with the registry under test.
    struct ManualClock
    {
        std::shared_ptr<std::chrono::system_clock::time_point> now =
            std::make_shared<std::chrono::system_clock::time_point>(std::chrono::seconds(1700000000));

        JobRegistry::Clock Fn() const
        {
            auto shared = now;
            return [shared]
            { return *shared; };
        }

        void Advance(std::chrono::seconds by) { *now += by; }
    };

    ScanResult Authenticated(const std::string &address, HostFailure failure = HostFailure::None)
    {
        ScanResult result;
        result.address = address;
        result.credential_id = 1;
        if (failure == HostFailure::None)
            result.family = DeviceFamily::NetworkDevice;
        result.failure = failure;
        return result;
    }
}

TEST(ScanJobTest, CountersTrackEveryOutcome)
{
    ScanJob job("scan_1_1", std::chrono::system_clock::now(), 4);

    job.RecordUnreachable();
    job.RecordAlive();
    job.RecordAlive();
    job.RecordAlive();
    job.RecordAuthFailed("10.0.0.2");
    job.RecordAuthenticated(Authenticated("10.0.0.3"));
    job.RecordAuthenticated(Authenticated("10.0.0.4", HostFailure::DriverNotSupported));

    auto c = job.Counters();
    EXPECT_EQ(c.total, 4u);
    EXPECT_EQ(c.scanned, 4u);
    EXPECT_EQ(c.alive, 3u);
    EXPECT_EQ(c.unreachable, 1u);
    EXPECT_EQ(c.auth_failed, 1u);
    EXPECT_EQ(c.authenticated, 2u);
    EXPECT_EQ(c.driver_not_supported, 1u);
    EXPECT_EQ(c.scanned, c.alive + c.unreachable);
    EXPECT_EQ(c.alive, c.authenticated + c.auth_failed);

    auto snapshot = job.Snapshot();
    ASSERT_EQ(snapshot.results.size(), 3u);
    EXPECT_EQ(snapshot.results[0].failure, HostFailure::AuthFailed);
    EXPECT_FALSE(snapshot.results[0].credential_id.has_value());
    EXPECT_TRUE(snapshot.results[1].IsOnboardable());
    EXPECT_FALSE(snapshot.results[2].IsOnboardable());
}

TEST(ScanJobTest, ResultsAreUniquePerAddress)
{
    ScanJob job("scan_1_1", std::chrono::system_clock::now(), 1);

    job.RecordAuthenticated(Authenticated("10.0.0.1"));
    job.RecordAuthenticated(Authenticated("10.0.0.1"));

    EXPECT_EQ(job.Snapshot().results.size(), 1u);
}

TEST(ScanJobTest, FinishAndErrorsAreVisibleInSnapshot)
{
    ScanJob job("scan_1_1", std::chrono::system_clock::time_point(std::chrono::seconds(42)), 0);
    EXPECT_EQ(job.State(), JobState::Running);

    job.RecordError("10.0.0.9: probe crashed");
    job.Finish();

    auto snapshot = job.Snapshot();
    EXPECT_EQ(snapshot.state, JobState::Finished);
    EXPECT_EQ(snapshot.created_unix, 42);
    ASSERT_EQ(snapshot.errors.size(), 1u);
    EXPECT_EQ(snapshot.errors[0], "10.0.0.9: probe crashed");

    auto summary = job.Summary();
    EXPECT_EQ(summary.job_id, "scan_1_1");
    EXPECT_EQ(summary.state, JobState::Finished);
}

TEST(JobRegistryTest, JobIdsAreUniqueAndWellFormed)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::hours(24), clock.Fn());

    auto a = registry.Create(1);
    auto b = registry.Create(1);

    EXPECT_NE(a->Id(), b->Id());
    EXPECT_TRUE(std::regex_match(a->Id(), std::regex("scan_[0-9]+_[0-9]+")));
    EXPECT_EQ(registry.Size(), 2u);
}

TEST(JobRegistryTest, FindAndSnapshotReturnLiveJobs)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::hours(24), clock.Fn());

    auto job = registry.Create(3);
    job->RecordUnreachable();

    EXPECT_EQ(registry.Find(job->Id()), job);
    auto snapshot = registry.Snapshot(job->Id());
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->counters.unreachable, 1u);

    EXPECT_EQ(registry.Find("scan_0_0"), nullptr);
    EXPECT_FALSE(registry.Snapshot("scan_0_0").has_value());
}

TEST(JobRegistryTest, ListIsOldestFirst)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::hours(24), clock.Fn());

    auto first = registry.Create(1);
    clock.Advance(std::chrono::seconds(5));
    auto second = registry.Create(2);
    clock.Advance(std::chrono::seconds(5));
    auto third = registry.Create(3);

    auto list = registry.List();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].job_id, first->Id());
    EXPECT_EQ(list[1].job_id, second->Id());
    EXPECT_EQ(list[2].job_id, third->Id());
    EXPECT_EQ(list[2].total, 3u);
}

TEST(JobRegistryTest, ExpiredJobsDisappear)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::seconds(3600), clock.Fn());

    auto old_job = registry.Create(1);
    clock.Advance(std::chrono::seconds(1800));
    auto young_job = registry.Create(1);
    clock.Advance(std::chrono::seconds(1800));

    EXPECT_EQ(registry.Find(old_job->Id()), nullptr);
    EXPECT_NE(registry.Find(young_job->Id()), nullptr);
    EXPECT_EQ(registry.List().size(), 1u);
}

TEST(JobRegistryTest, PurgeExpiredReportsCount)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::seconds(60), clock.Fn());

    registry.Create(1);
    registry.Create(1);
    clock.Advance(std::chrono::seconds(61));
    registry.Create(1);

    EXPECT_EQ(registry.PurgeExpired(), 2u);
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(JobRegistryTest, RemoveDeletesOnlyOnce)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::hours(1), clock.Fn());

    auto job = registry.Create(1);

    EXPECT_TRUE(registry.Remove(job->Id()));
    EXPECT_FALSE(registry.Remove(job->Id()));
    EXPECT_EQ(registry.Find(job->Id()), nullptr);
}

TEST(JobRegistryTest, RemovedJobStaysUsableByHolders)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::hours(1), clock.Fn());

    auto job = registry.Create(1);
    registry.Remove(job->Id());

    job->RecordUnreachable();
    job->Finish();
    EXPECT_EQ(job->Snapshot().counters.scanned, 1u);
}

TEST(JobRegistryTest, BackgroundSweepPurges)
{
    ManualClock clock;
    JobRegistry registry(std::chrono::seconds(10), clock.Fn(), std::chrono::milliseconds(10));

    registry.Create(1);
    clock.Advance(std::chrono::seconds(11));
    registry.Start();

    for (int i = 0; i < 200 && registry.Size() > 0; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    registry.Stop();

    EXPECT_EQ(registry.Size(), 0u);
}
