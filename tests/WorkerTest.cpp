#include "server/Worker.hpp"
#include "common/Messages.hpp"
#include "Fakes.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <map>
#include <mutex>

using namespace netscout;
using netscout::protocol::MessageType;
using netscout::server::Reply;
using netscout::server::Worker;

namespace
{
    class WorkerTest : public ::testing::Test
    {
    protected:
        WorkerTest()
            : coordinator(registry, pinger, sessions, credentials, &templates, Limits()),
              dispatcher(registry, registrar, engine, artifacts, &templates),
              worker(coordinator, registry, dispatcher)
        {
            credentials.Add(1, "admin", "pw");
            sessions.handler = [](const std::string &address, const scan::CredentialSecret &)
            {
                auto session = std::make_unique<netscout::testing::FakeSession>(address);
                session->Respond("hostname", "web01");
                return netscout::testing::FakeSessionFactory::Accept(std::move(session));
            };
        }

        static scan::ScanLimits Limits()
        {
            scan::ScanLimits limits;
            limits.ping_timeout = std::chrono::milliseconds(5);
            limits.login_timeout = std::chrono::milliseconds(5);
            return limits;
        }

        static std::string ErrorText(const Reply &reply)
        {
            EXPECT_EQ(reply.type, MessageType::ErrorResp);
            std::string message;
            EXPECT_TRUE(common::DecodeError(reply.payload, message));
            return message;
        }

        std::string StartScan(const std::vector<std::string> &cidrs)
        {
            scan::ScanRequest request;
            request.cidrs = cidrs;
            request.credential_ids = {1};

            Reply reply = worker.Handle(MessageType::ScanStartReq, common::EncodeScanRequest(request));
            EXPECT_EQ(reply.type, MessageType::ScanStartResp);

            common::ScanStartResponse response;
            EXPECT_TRUE(common::DecodeScanStartResponse(reply.payload, response));
            coordinator.JoinAll();
            return response.job_id;
        }

        scan::JobRegistry registry{std::chrono::hours(1)};
        netscout::testing::FakePinger pinger;
        netscout::testing::FakeCredentialStore credentials;
        netscout::testing::FakeSessionFactory sessions;
        netscout::testing::FakeTemplateStore templates;
        netscout::testing::FakeRegistrar registrar;
        netscout::testing::FakeTemplateEngine engine;
        netscout::testing::FakeArtifactStore artifacts;
        scan::ScanCoordinator coordinator;
        onboard::OnboardingDispatcher dispatcher;
        Worker worker;
    };
}

TEST_F(WorkerTest, ScanStartReportsJobAndTargetCount)
{
    scan::ScanRequest request;
    request.cidrs = {"10.0.0.0/30"};
    request.credential_ids = {1};

    Reply reply = worker.Handle(MessageType::ScanStartReq, common::EncodeScanRequest(request));
    ASSERT_EQ(reply.type, MessageType::ScanStartResp);

    common::ScanStartResponse response;
    ASSERT_TRUE(common::DecodeScanStartResponse(reply.payload, response));
    EXPECT_EQ(response.total_targets, 2u);
    EXPECT_EQ(response.job_id.rfind("scan_", 0), 0u);
    coordinator.JoinAll();
}

TEST_F(WorkerTest, ValidationErrorsComeBackVerbatim)
{
    scan::ScanRequest request;
    request.cidrs = {"10.0.0.0/30"};
    request.credential_ids = {42};

    Reply reply = worker.Handle(MessageType::ScanStartReq, common::EncodeScanRequest(request));
    EXPECT_EQ(ErrorText(reply), "No valid credentials");
}

TEST_F(WorkerTest, MalformedPayloadsAreRejected)
{
    std::vector<uint8_t> junk = {0x01};
    EXPECT_EQ(ErrorText(worker.Handle(MessageType::ScanStartReq, junk)), "Malformed scan request");
    EXPECT_EQ(ErrorText(worker.Handle(MessageType::ScanStatusReq, junk)), "Malformed status request");
    EXPECT_EQ(ErrorText(worker.Handle(MessageType::ScanDeleteReq, junk)), "Malformed delete request");
    EXPECT_EQ(ErrorText(worker.Handle(MessageType::OnboardReq, junk)), "Malformed onboarding request");
    EXPECT_EQ(ErrorText(worker.Handle(MessageType::ScanStartResp, {})), "Unsupported message type");
}

TEST_F(WorkerTest, StatusListAndDeleteFollowJobLifecycle)
{
    pinger.alive = {"10.0.0.1"};
    std::string job_id = StartScan({"10.0.0.0/30"});

    Reply status = worker.Handle(MessageType::ScanStatusReq, common::EncodeJobId(job_id));
    ASSERT_EQ(status.type, MessageType::ScanStatusResp);
    scan::ScanJobSnapshot snapshot;
    ASSERT_TRUE(common::DecodeSnapshot(status.payload, snapshot));
    EXPECT_EQ(snapshot.state, scan::JobState::Finished);
    EXPECT_EQ(snapshot.counters.authenticated, 1u);
    EXPECT_EQ(snapshot.counters.unreachable, 1u);

    Reply list = worker.Handle(MessageType::ScanListReq, {});
    ASSERT_EQ(list.type, MessageType::ScanListResp);
    std::vector<scan::ScanJobSummary> summaries;
    ASSERT_TRUE(common::DecodeSummaries(list.payload, summaries));
    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].job_id, job_id);

    Reply deleted = worker.Handle(MessageType::ScanDeleteReq, common::EncodeJobId(job_id));
    ASSERT_EQ(deleted.type, MessageType::ScanDeleteResp);

    EXPECT_EQ(ErrorText(worker.Handle(MessageType::ScanStatusReq, common::EncodeJobId(job_id))), "NOT_FOUND");
    EXPECT_EQ(ErrorText(worker.Handle(MessageType::ScanDeleteReq, common::EncodeJobId(job_id))), "NOT_FOUND");
}

TEST_F(WorkerTest, OnboardDispatchesSelectedServers)
{
    pinger.alive = {"10.0.0.1"};
    std::string job_id = StartScan({"10.0.0.1/32"});

    onboard::OnboardRequest request;
    request.job_id = job_id;
    request.devices.push_back(onboard::DeviceSelection{"10.0.0.1", {}});

    Reply reply = worker.Handle(MessageType::OnboardReq, common::EncodeOnboardRequest(request));
    ASSERT_EQ(reply.type, MessageType::OnboardResp);

    onboard::OnboardResult result;
    ASSERT_TRUE(common::DecodeOnboardResult(reply.payload, result));
    EXPECT_EQ(result.accepted, 1u);
    EXPECT_EQ(result.servers_added, 1u);
    EXPECT_EQ(result.artifact_path, "/inventory/inventory_" + job_id + ".yaml");
}

TEST_F(WorkerTest, OnboardUnknownJobIsNotFound)
{
    onboard::OnboardRequest request;
    request.job_id = "scan_0_0";

    EXPECT_EQ(ErrorText(worker.Handle(MessageType::OnboardReq, common::EncodeOnboardRequest(request))), "NOT_FOUND");
}

TEST_F(WorkerTest, QueuedJobsDrainOnStop)
{
    worker.Start();
    worker.AddJob(-1, 1, MessageType::ScanListReq, {});
    worker.Stop();
    worker.AddJob(-1, 2, MessageType::ScanListReq, {});
    SUCCEED();
}

TEST_F(WorkerTest, StatusPollsAreAnsweredWhileOnboardingBlocks)
{
    pinger.alive = {"10.0.0.1"};
    sessions.handler = [](const std::string &address, const scan::CredentialSecret &)
    {
        auto session = std::make_unique<netscout::testing::FakeSession>(address);
        session->Respond("show version",
                         "Cisco IOS Software, C2960 Software (C2960-LANBASEK9-M), Version 15.0(2)SE11\n"
                         "edge-sw01 uptime is 3 weeks, 2 days\n");
        return netscout::testing::FakeSessionFactory::Accept(std::move(session));
    };
    std::string job_id = StartScan({"10.0.0.1/32"});

    std::mutex mutex;
    std::condition_variable cv;
    bool registering = false;
    bool released = false;
    std::map<uint64_t, Reply> replies;

    registrar.before_register = [&](const std::string &)
    {
        std::unique_lock<std::mutex> lock(mutex);
        registering = true;
        cv.notify_all();
        cv.wait(lock, [&]
                { return released; });
    };
    worker.SetReplySink([&](int, uint64_t connection_id, const Reply &reply)
                        {
                            std::lock_guard<std::mutex> lock(mutex);
                            replies[connection_id] = reply;
                            cv.notify_all(); });
    worker.Start();

    onboard::OnboardRequest request;
    request.job_id = job_id;
    request.devices.push_back(onboard::DeviceSelection{"10.0.0.1", {}});
    worker.AddJob(-1, 1, MessageType::OnboardReq, common::EncodeOnboardRequest(request));

    bool blocked = false;
    bool status_answered = false;
    bool onboard_pending = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        blocked = cv.wait_for(lock, std::chrono::seconds(5), [&]
                              { return registering; });
    }

    worker.AddJob(-1, 2, MessageType::ScanStatusReq, common::EncodeJobId(job_id));
    {
        std::unique_lock<std::mutex> lock(mutex);
        status_answered = cv.wait_for(lock, std::chrono::seconds(5), [&]
                                      { return replies.count(2) > 0; });
        onboard_pending = replies.count(1) == 0;
        released = true;
        cv.notify_all();
    }

    bool onboard_answered = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        onboard_answered = cv.wait_for(lock, std::chrono::seconds(5), [&]
                                       { return replies.count(1) > 0; });
    }
    worker.Stop();

    EXPECT_TRUE(blocked);
    EXPECT_TRUE(status_answered);
    EXPECT_TRUE(onboard_pending);
    ASSERT_TRUE(onboard_answered);
    EXPECT_EQ(replies[2].type, MessageType::ScanStatusResp);
    EXPECT_EQ(replies[1].type, MessageType::OnboardResp);

    onboard::OnboardResult result;
    ASSERT_TRUE(common::DecodeOnboardResult(replies[1].payload, result));
    EXPECT_EQ(result.network_queued, 1u);
}
