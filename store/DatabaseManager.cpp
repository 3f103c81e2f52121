#include "DatabaseManager.hpp"

#include <cctype>
#include <ctime>
#include <iostream>

namespace netscout::store
{
    namespace
    {
        std::string ColumnText(sqlite3_stmt *stmt, int column)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
            return text ? std::string(text) : std::string();
        }

        const char *CategoryName(scan::TemplateCategory category)
        {
            return category == scan::TemplateCategory::Parser ? "parser" : "inventory";
        }

        std::optional<scan::TemplateCategory> ParseCategory(const std::string &name)
        {
            if (name == "parser")
                return scan::TemplateCategory::Parser;
            if (name == "inventory")
                return scan::TemplateCategory::Inventory;
            return std::nullopt;
        }

        std::string AddDays(const std::string &date, int days)
        {
            std::tm tm{};
            tm.tm_year = std::stoi(date.substr(0, 4)) - 1900;
            tm.tm_mon = std::stoi(date.substr(5, 2)) - 1;
            tm.tm_mday = std::stoi(date.substr(8, 2)) + days;
            tm.tm_hour = 12;
            time_t t = timegm(&tm);

            std::tm out{};
            gmtime_r(&t, &out);
            char buf[11];
            std::strftime(buf, sizeof(buf), "%Y-%m-%d", &out);
            return buf;
        }

        scan::TemplateRecord ReadTemplateRow(sqlite3_stmt *stmt)
        {
            scan::TemplateRecord record;
            record.id = sqlite3_column_int(stmt, 0);
            record.name = ColumnText(stmt, 1);
            record.category = ParseCategory(ColumnText(stmt, 2)).value_or(scan::TemplateCategory::Parser);
            record.content = ColumnText(stmt, 3);
            return record;
        }
    }

    DatabaseManager::DatabaseManager(const std::string &secret_key) : db_(nullptr), box_(secret_key) {}

    DatabaseManager::~DatabaseManager()
    {
        Shutdown();
    }

    bool DatabaseManager::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[DB] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS credentials ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "name TEXT UNIQUE NOT NULL, "
            "username TEXT NOT NULL, "
            "type TEXT NOT NULL, "
            "password_encrypted BLOB NOT NULL, "
            "valid_until TEXT, "
            "is_active INTEGER NOT NULL DEFAULT 1, "
            "created_at DATETIME DEFAULT CURRENT_TIMESTAMP, "
            "updated_at DATETIME DEFAULT CURRENT_TIMESTAMP"
            ");"

            "CREATE TABLE IF NOT EXISTS templates ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "name TEXT UNIQUE NOT NULL, "
            "category TEXT NOT NULL, "
            "content TEXT NOT NULL, "
            "created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DB] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    void DatabaseManager::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool DatabaseManager::IsValidCredentialType(const std::string &type)
    {
        return type == "ssh" || type == "tacacs" || type == "generic" || type == "token";
    }

    bool DatabaseManager::IsValidDate(const std::string &date)
    {
        if (date.size() != 10 || date[4] != '-' || date[7] != '-')
            return false;
        for (size_t i = 0; i < date.size(); ++i)
        {
            if (i == 4 || i == 7)
                continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i])))
                return false;
        }
        int month = std::stoi(date.substr(5, 2));
        int day = std::stoi(date.substr(8, 2));
        return month >= 1 && month <= 12 && day >= 1 && day <= 31;
    }

    std::string DatabaseManager::TodayUtc()
    {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        gmtime_r(&now, &tm);
        char buf[11];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
        return buf;
    }

    std::string DatabaseManager::CredentialStatus(const std::string &valid_until, bool is_active, const std::string &today)
    {
        if (!is_active)
            return "inactive";
        if (valid_until.empty() || !IsValidDate(today))
            return "active";
        // ISO dates compare correctly as strings
        if (valid_until < today)
            return "expired";
        if (valid_until <= AddDays(today, 7))
            return "expiring";
        return "active";
    }

    int DatabaseManager::CreateCredential(const std::string &name, const std::string &username, const std::string &type,
                                          const std::string &password, const std::string &valid_until)
    {
        if (!IsValidCredentialType(type))
        {
            std::cerr << "[DB] Unknown credential type: " << type << std::endl;
            return -1;
        }
        if (!valid_until.empty() && !IsValidDate(valid_until))
        {
            std::cerr << "[DB] Invalid valid_until date: " << valid_until << std::endl;
            return -1;
        }

        std::vector<uint8_t> sealed = box_.Seal(password);

        std::lock_guard<std::mutex> lock(db_mutex_);
        const char *sql = "INSERT INTO credentials (name, username, type, password_encrypted, valid_until) "
                          "VALUES (?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return -1;

        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, username.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 4, sealed.data(), static_cast<int>(sealed.size()), SQLITE_TRANSIENT);
        if (valid_until.empty())
            sqlite3_bind_null(stmt, 5);
        else
            sqlite3_bind_text(stmt, 5, valid_until.c_str(), -1, SQLITE_TRANSIENT);

        int new_id = -1;
        if (sqlite3_step(stmt) == SQLITE_DONE)
            new_id = static_cast<int>(sqlite3_last_insert_rowid(db_));
        else
            std::cerr << "[DB] Insert credential '" << name << "' failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return new_id;
    }

    bool DatabaseManager::SetCredentialActive(int id, bool active)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "UPDATE credentials SET is_active = ?, updated_at = CURRENT_TIMESTAMP WHERE id = ?;",
                               -1, &stmt, nullptr) != SQLITE_OK)
            return false;
        sqlite3_bind_int(stmt, 1, active ? 1 : 0);
        sqlite3_bind_int(stmt, 2, id);
        bool ok = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db_) > 0;
        sqlite3_finalize(stmt);
        return ok;
    }

    bool DatabaseManager::DeleteCredential(int id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM credentials WHERE id = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return false;
        sqlite3_bind_int(stmt, 1, id);
        bool ok = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db_) > 0;
        sqlite3_finalize(stmt);
        return ok;
    }

    std::optional<CredentialRecord> DatabaseManager::GetCredentialLocked(int id)
    {
        const char *sql = "SELECT id, name, username, type, valid_until, is_active FROM credentials WHERE id = ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return std::nullopt;

        sqlite3_bind_int(stmt, 1, id);
        std::optional<CredentialRecord> result = std::nullopt;
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            CredentialRecord record;
            record.id = sqlite3_column_int(stmt, 0);
            record.name = ColumnText(stmt, 1);
            record.username = ColumnText(stmt, 2);
            record.type = ColumnText(stmt, 3);
            record.valid_until = ColumnText(stmt, 4);
            record.is_active = sqlite3_column_int(stmt, 5) != 0;
            record.status = CredentialStatus(record.valid_until, record.is_active, TodayUtc());
            result = record;
        }
        sqlite3_finalize(stmt);
        return result;
    }

    std::optional<CredentialRecord> DatabaseManager::GetCredential(int id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return GetCredentialLocked(id);
    }

    std::vector<CredentialRecord> DatabaseManager::ListCredentials()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<CredentialRecord> records;
        const char *sql = "SELECT id, name, username, type, valid_until, is_active FROM credentials ORDER BY id;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return records;

        std::string today = TodayUtc();
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            CredentialRecord record;
            record.id = sqlite3_column_int(stmt, 0);
            record.name = ColumnText(stmt, 1);
            record.username = ColumnText(stmt, 2);
            record.type = ColumnText(stmt, 3);
            record.valid_until = ColumnText(stmt, 4);
            record.is_active = sqlite3_column_int(stmt, 5) != 0;
            record.status = CredentialStatus(record.valid_until, record.is_active, today);
            records.push_back(record);
        }
        sqlite3_finalize(stmt);
        return records;
    }

    bool DatabaseManager::IsUsable(int credential_id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        auto record = GetCredentialLocked(credential_id);
        return record && (record->status == "active" || record->status == "expiring");
    }

    std::optional<scan::CredentialSecret> DatabaseManager::Resolve(int credential_id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        auto record = GetCredentialLocked(credential_id);
        if (!record || (record->status != "active" && record->status != "expiring"))
            return std::nullopt;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT password_encrypted FROM credentials WHERE id = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return std::nullopt;
        sqlite3_bind_int(stmt, 1, credential_id);

        std::vector<uint8_t> sealed;
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            const void *blob = sqlite3_column_blob(stmt, 0);
            int blob_len = sqlite3_column_bytes(stmt, 0);
            if (blob)
                sealed.assign(static_cast<const uint8_t *>(blob), static_cast<const uint8_t *>(blob) + blob_len);
        }
        sqlite3_finalize(stmt);

        auto password = box_.Open(sealed);
        if (!password)
        {
            std::cerr << "[DB] Credential " << credential_id << " could not be decrypted" << std::endl;
            return std::nullopt;
        }

        return scan::CredentialSecret(record->username, std::move(*password));
    }

    int DatabaseManager::CreateTemplate(const std::string &name, scan::TemplateCategory category, const std::string &content)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "INSERT INTO templates (name, category, content) VALUES (?, ?, ?);", -1, &stmt, nullptr) != SQLITE_OK)
            return -1;
        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, CategoryName(category), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, content.c_str(), -1, SQLITE_TRANSIENT);

        int new_id = -1;
        if (sqlite3_step(stmt) == SQLITE_DONE)
            new_id = static_cast<int>(sqlite3_last_insert_rowid(db_));
        else
            std::cerr << "[DB] Insert template '" << name << "' failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return new_id;
    }

    std::optional<scan::TemplateRecord> DatabaseManager::GetTemplate(int template_id)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT id, name, category, content FROM templates WHERE id = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return std::nullopt;
        sqlite3_bind_int(stmt, 1, template_id);

        std::optional<scan::TemplateRecord> result = std::nullopt;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            result = ReadTemplateRow(stmt);
        sqlite3_finalize(stmt);
        return result;
    }

    std::vector<scan::TemplateRecord> DatabaseManager::ListTemplates()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<scan::TemplateRecord> templates;
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT id, name, category, content FROM templates ORDER BY id;", -1, &stmt, nullptr) != SQLITE_OK)
            return templates;
        while (sqlite3_step(stmt) == SQLITE_ROW)
            templates.push_back(ReadTemplateRow(stmt));
        sqlite3_finalize(stmt);
        return templates;
    }
}
