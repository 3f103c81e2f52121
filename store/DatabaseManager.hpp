#pragma once

#include "SecretBox.hpp"
#include "../scan/Collaborators.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace netscout::store
{
    // Never carries the password; Resolve() is the only way to it.
    struct CredentialRecord
    {
        int id = 0;
        std::string name;
        std::string username;
        std::string type;
        std::string valid_until; // YYYY-MM-DD or empty
        bool is_active = true;
        std::string status;      // active, expiring, expired, inactive
    };

    // SQLite settings database holding connection credentials and templates.
    class DatabaseManager : public scan::CredentialStore, public scan::TemplateStore
    {
    private:
        sqlite3 *db_;
        std::mutex db_mutex_;
        SecretBox box_;

    public:
        // Throws std::invalid_argument on an empty secret.
        explicit DatabaseManager(const std::string &secret_key);
        ~DatabaseManager() override;

        DatabaseManager(const DatabaseManager &) = delete;
        DatabaseManager &operator=(const DatabaseManager &) = delete;

        bool Initialize(const std::string &db_path);
        void Shutdown();

        // Returns the new id, or -1 on a bad type, bad date or SQL failure.
        int CreateCredential(const std::string &name, const std::string &username, const std::string &type,
                             const std::string &password, const std::string &valid_until = "");
        bool SetCredentialActive(int id, bool active);
        bool DeleteCredential(int id);
        std::optional<CredentialRecord> GetCredential(int id);
        std::vector<CredentialRecord> ListCredentials();

        bool IsUsable(int credential_id) override;
        std::optional<scan::CredentialSecret> Resolve(int credential_id) override;

        int CreateTemplate(const std::string &name, scan::TemplateCategory category, const std::string &content);
        std::optional<scan::TemplateRecord> GetTemplate(int template_id) override;
        std::vector<scan::TemplateRecord> ListTemplates();

        static bool IsValidCredentialType(const std::string &type);
        static bool IsValidDate(const std::string &date);

        // Status for a credential relative to `today` (YYYY-MM-DD).
        static std::string CredentialStatus(const std::string &valid_until, bool is_active, const std::string &today);
        static std::string TodayUtc();

    private:
        std::optional<CredentialRecord> GetCredentialLocked(int id);
    };
}
