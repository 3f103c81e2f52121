#include "store/DatabaseManager.hpp"
#include "store/SecretBox.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <unistd.h>

using netscout::scan::TemplateCategory;
using netscout::store::DatabaseManager;
using netscout::store::SecretBox;

namespace fs = std::filesystem;

namespace
{
    class DatabaseManagerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            path = fs::temp_directory_path() /
                   ("netscout_db_" + std::to_string(::getpid()) + "_" + info->name() + ".db");
            Cleanup();
        }

        void TearDown() override { Cleanup(); }

        void Cleanup()
        {
            std::error_code ec;
            for (const char *suffix : {"", "-wal", "-shm"})
                fs::remove(path.string() + suffix, ec);
        }

        fs::path path;
    };
}

TEST(SecretBoxTest, SealedSecretsOpenOnlyWithTheSameKey)
{
    SecretBox box("operator-secret");
    auto sealed = box.Seal("hunter2");

    EXPECT_EQ(sealed.size(), SecretBox::IV_SIZE + SecretBox::TAG_SIZE + 7);
    EXPECT_EQ(box.Open(sealed), "hunter2");

    SecretBox other("another-secret");
    EXPECT_FALSE(other.Open(sealed).has_value());
}

TEST(SecretBoxTest, SealingIsRandomised)
{
    SecretBox box("k");
    EXPECT_NE(box.Seal("same"), box.Seal("same"));
}

TEST(SecretBoxTest, TamperingAndTruncationAreDetected)
{
    SecretBox box("k");
    auto sealed = box.Seal("payload");

    auto tampered = sealed;
    tampered.back() ^= 0x01;
    EXPECT_FALSE(box.Open(tampered).has_value());

    std::vector<uint8_t> truncated(sealed.begin(), sealed.begin() + 10);
    EXPECT_FALSE(box.Open(truncated).has_value());
}

TEST(SecretBoxTest, EmptySecretIsRefused)
{
    EXPECT_THROW(SecretBox(""), std::invalid_argument);
}

TEST(CredentialStatusTest, DerivedFromExpiryAndActiveFlag)
{
    EXPECT_EQ(DatabaseManager::CredentialStatus("", true, "2026-01-10"), "active");
    EXPECT_EQ(DatabaseManager::CredentialStatus("2026-01-10", false, "2026-01-10"), "inactive");
    EXPECT_EQ(DatabaseManager::CredentialStatus("2026-01-09", true, "2026-01-10"), "expired");
    EXPECT_EQ(DatabaseManager::CredentialStatus("2026-01-10", true, "2026-01-10"), "expiring");
    EXPECT_EQ(DatabaseManager::CredentialStatus("2026-01-17", true, "2026-01-10"), "expiring");
    EXPECT_EQ(DatabaseManager::CredentialStatus("2026-01-18", true, "2026-01-10"), "active");
    EXPECT_EQ(DatabaseManager::CredentialStatus("2026-01-03", true, "2025-12-30"), "expiring");
}

TEST(CredentialStatusTest, DateAndTypeValidation)
{
    EXPECT_TRUE(DatabaseManager::IsValidDate("2026-02-28"));
    EXPECT_FALSE(DatabaseManager::IsValidDate("2026-13-01"));
    EXPECT_FALSE(DatabaseManager::IsValidDate("26-01-01"));
    EXPECT_FALSE(DatabaseManager::IsValidDate("2026/01/01"));

    EXPECT_TRUE(DatabaseManager::IsValidCredentialType("ssh"));
    EXPECT_TRUE(DatabaseManager::IsValidCredentialType("tacacs"));
    EXPECT_FALSE(DatabaseManager::IsValidCredentialType("snmp"));
}

TEST_F(DatabaseManagerTest, CredentialsRoundTripThroughEncryption)
{
    DatabaseManager db("operator-secret");
    ASSERT_TRUE(db.Initialize(path.string()));

    int id = db.CreateCredential("core-admin", "admin", "ssh", "s3cret!");
    ASSERT_GT(id, 0);

    auto record = db.GetCredential(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "core-admin");
    EXPECT_EQ(record->username, "admin");
    EXPECT_EQ(record->status, "active");

    EXPECT_TRUE(db.IsUsable(id));
    auto secret = db.Resolve(id);
    ASSERT_TRUE(secret.has_value());
    EXPECT_EQ(secret->username, "admin");
    EXPECT_EQ(secret->password, "s3cret!");
}

TEST_F(DatabaseManagerTest, WrongKeyCannotResolve)
{
    int id = 0;
    {
        DatabaseManager db("first-key");
        ASSERT_TRUE(db.Initialize(path.string()));
        id = db.CreateCredential("c", "u", "ssh", "pw");
        ASSERT_GT(id, 0);
    }

    DatabaseManager reopened("second-key");
    ASSERT_TRUE(reopened.Initialize(path.string()));
    EXPECT_TRUE(reopened.IsUsable(id));
    EXPECT_FALSE(reopened.Resolve(id).has_value());
}

TEST_F(DatabaseManagerTest, InvalidInputIsRejected)
{
    DatabaseManager db("k");
    ASSERT_TRUE(db.Initialize(path.string()));

    EXPECT_EQ(db.CreateCredential("a", "u", "telnet", "pw"), -1);
    EXPECT_EQ(db.CreateCredential("b", "u", "ssh", "pw", "tomorrow"), -1);

    ASSERT_GT(db.CreateCredential("dup", "u", "ssh", "pw"), 0);
    EXPECT_EQ(db.CreateCredential("dup", "u", "ssh", "pw"), -1);
    EXPECT_EQ(db.ListCredentials().size(), 1u);
}

TEST_F(DatabaseManagerTest, ExpiredAndInactiveCredentialsAreUnusable)
{
    DatabaseManager db("k");
    ASSERT_TRUE(db.Initialize(path.string()));

    int expired = db.CreateCredential("old", "u", "ssh", "pw", "2000-01-01");
    int disabled = db.CreateCredential("off", "u", "ssh", "pw", "2999-12-31");
    ASSERT_GT(expired, 0);
    ASSERT_GT(disabled, 0);
    ASSERT_TRUE(db.SetCredentialActive(disabled, false));

    EXPECT_EQ(db.GetCredential(expired)->status, "expired");
    EXPECT_EQ(db.GetCredential(disabled)->status, "inactive");
    EXPECT_FALSE(db.IsUsable(expired));
    EXPECT_FALSE(db.IsUsable(disabled));
    EXPECT_FALSE(db.Resolve(expired).has_value());
    EXPECT_FALSE(db.Resolve(disabled).has_value());
    EXPECT_FALSE(db.IsUsable(12345));
}

TEST_F(DatabaseManagerTest, DeleteRemovesCredential)
{
    DatabaseManager db("k");
    ASSERT_TRUE(db.Initialize(path.string()));

    int id = db.CreateCredential("c", "u", "ssh", "pw");
    EXPECT_TRUE(db.DeleteCredential(id));
    EXPECT_FALSE(db.DeleteCredential(id));
    EXPECT_FALSE(db.GetCredential(id).has_value());
}

TEST_F(DatabaseManagerTest, TemplatesAreStoredByCategory)
{
    DatabaseManager db("k");
    ASSERT_TRUE(db.Initialize(path.string()));

    int parser = db.CreateTemplate("ios_show_version", TemplateCategory::Parser, "Value X (.*)\n\nStart\n");
    int inventory = db.CreateTemplate("servers", TemplateCategory::Inventory, "all: {}");
    ASSERT_GT(parser, 0);
    ASSERT_GT(inventory, 0);
    EXPECT_EQ(db.CreateTemplate("servers", TemplateCategory::Inventory, "x"), -1);

    auto fetched = db.GetTemplate(inventory);
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched->category, TemplateCategory::Inventory);
    EXPECT_EQ(fetched->content, "all: {}");
    EXPECT_FALSE(db.GetTemplate(999).has_value());

    auto all = db.ListTemplates();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "ios_show_version");
    EXPECT_EQ(all[1].name, "servers");
}
