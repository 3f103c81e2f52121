#include "scan/CredentialTrial.hpp"
#include "Fakes.hpp"

#include <gtest/gtest.h>

using namespace netscout;
using netscout::testing::FakeCredentialStore;
using netscout::testing::FakeSession;
using netscout::testing::FakeSessionFactory;

namespace
{
    class CredentialTrialTest : public ::testing::Test
    {
    protected:
        FakeCredentialStore credentials;
        FakeSessionFactory sessions;

        scan::CredentialTrialEngine Engine(int attempts = 3)
        {
            return scan::CredentialTrialEngine(credentials, sessions, std::chrono::milliseconds(100), attempts);
        }
    };
}

TEST_F(CredentialTrialTest, FirstWorkingCredentialWins)
{
    credentials.Add(1, "admin", "wrong");
    credentials.Add(2, "admin", "right");
    credentials.Add(3, "backup", "also-right");
    sessions.handler = [](const std::string &address, const scan::CredentialSecret &secret)
    {
        if (secret.password == "wrong")
            return FakeSessionFactory::Fail(scan::LoginStatus::Rejected, "auth denied");
        return FakeSessionFactory::Accept(std::make_unique<FakeSession>(address));
    };

    auto engine = Engine();
    auto outcome = engine.Authenticate("10.0.0.1", {1, 2, 3});

    ASSERT_TRUE(outcome.Succeeded());
    EXPECT_EQ(*outcome.credential_id, 2);
    EXPECT_EQ(outcome.session->Address(), "10.0.0.1");
    EXPECT_EQ(outcome.attempts, 2);
    EXPECT_EQ(sessions.Attempts().size(), 2u);
}

TEST_F(CredentialTrialTest, RejectionIsNotRetried)
{
    credentials.Add(1, "admin", "wrong");
    sessions.handler = [](const std::string &, const scan::CredentialSecret &)
    {
        return FakeSessionFactory::Fail(scan::LoginStatus::Rejected);
    };

    auto engine = Engine(3);
    auto outcome = engine.Authenticate("10.0.0.1", {1});

    EXPECT_FALSE(outcome.Succeeded());
    EXPECT_FALSE(outcome.credential_id.has_value());
    EXPECT_EQ(outcome.attempts, 1);
}

TEST_F(CredentialTrialTest, TransportFailuresAreRetriedUpToTheLimit)
{
    credentials.Add(1, "admin", "pw");
    int calls = 0;
    sessions.handler = [&calls](const std::string &address, const scan::CredentialSecret &)
    {
        if (++calls < 3)
            return FakeSessionFactory::Fail(scan::LoginStatus::Unreachable, "timeout");
        return FakeSessionFactory::Accept(std::make_unique<FakeSession>(address));
    };

    auto engine = Engine(3);
    auto outcome = engine.Authenticate("10.0.0.2", {1});

    ASSERT_TRUE(outcome.Succeeded());
    EXPECT_EQ(outcome.attempts, 3);
}

TEST_F(CredentialTrialTest, ExhaustedRetriesMoveToNextCredential)
{
    credentials.Add(1, "flaky", "pw");
    credentials.Add(2, "steady", "pw");
    sessions.handler = [](const std::string &address, const scan::CredentialSecret &secret)
    {
        if (secret.username == "flaky")
            return FakeSessionFactory::Fail(scan::LoginStatus::Unreachable, "reset");
        return FakeSessionFactory::Accept(std::make_unique<FakeSession>(address));
    };

    auto engine = Engine(2);
    auto outcome = engine.Authenticate("10.0.0.3", {1, 2});

    ASSERT_TRUE(outcome.Succeeded());
    EXPECT_EQ(*outcome.credential_id, 2);
    EXPECT_EQ(outcome.attempts, 3);
}

TEST_F(CredentialTrialTest, FactoryExceptionsCountAsTransportFailures)
{
    credentials.Add(1, "admin", "pw");
    sessions.handler = [](const std::string &, const scan::CredentialSecret &) -> scan::LoginOutcome
    {
        throw std::runtime_error("kex failed");
    };

    auto engine = Engine(2);
    auto outcome = engine.Authenticate("10.0.0.4", {1});

    EXPECT_FALSE(outcome.Succeeded());
    EXPECT_EQ(outcome.attempts, 2);
}

TEST_F(CredentialTrialTest, UnusableAndUnknownCredentialsAreSkipped)
{
    credentials.Add(1, "expired", "pw", false);
    credentials.Add(3, "admin", "pw");
    sessions.handler = [](const std::string &address, const scan::CredentialSecret &)
    {
        return FakeSessionFactory::Accept(std::make_unique<FakeSession>(address));
    };

    auto engine = Engine();
    auto outcome = engine.Authenticate("10.0.0.5", {1, 2, 3});

    ASSERT_TRUE(outcome.Succeeded());
    EXPECT_EQ(*outcome.credential_id, 3);
    ASSERT_EQ(sessions.Attempts().size(), 1u);
    EXPECT_EQ(sessions.Attempts()[0].username, "admin");
}

TEST_F(CredentialTrialTest, AttemptLimitBelowOneIsClampedToOne)
{
    credentials.Add(1, "admin", "pw");
    sessions.handler = [](const std::string &, const scan::CredentialSecret &)
    {
        return FakeSessionFactory::Fail(scan::LoginStatus::Unreachable);
    };

    auto engine = Engine(0);
    auto outcome = engine.Authenticate("10.0.0.6", {1});

    EXPECT_EQ(outcome.attempts, 1);
}
