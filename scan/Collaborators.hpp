#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <openssl/crypto.h>

namespace netscout::scan
{
    // ---- reachability ----

    class Pinger
    {
    public:
        virtual ~Pinger() = default;
        virtual bool Ping(const std::string &address, std::chrono::milliseconds timeout) = 0;
    };

    // ---- credentials ----

    // Decrypted connection secret. Wiped on destruction; never copied.
    struct CredentialSecret
    {
        std::string username;
        std::string password;

        CredentialSecret() = default;
        CredentialSecret(std::string user, std::string pass)
            : username(std::move(user)), password(std::move(pass)) {}

        CredentialSecret(const CredentialSecret &) = delete;
        CredentialSecret &operator=(const CredentialSecret &) = delete;
        CredentialSecret(CredentialSecret &&other) noexcept
            : username(std::move(other.username)), password(std::move(other.password))
        {
            other.Wipe();
        }
        CredentialSecret &operator=(CredentialSecret &&other) noexcept
        {
            if (this != &other)
            {
                Wipe();
                username = std::move(other.username);
                password = std::move(other.password);
                other.Wipe();
            }
            return *this;
        }

        ~CredentialSecret() { Wipe(); }

        void Wipe()
        {
            if (!password.empty())
                OPENSSL_cleanse(&password[0], password.size());
            password.clear();
        }
    };

    class CredentialStore
    {
    public:
        virtual ~CredentialStore() = default;

        // Active and not expired.
        virtual bool IsUsable(int credential_id) = 0;
        virtual std::optional<CredentialSecret> Resolve(int credential_id) = 0;
    };

    // ---- device sessions ----

    struct CommandResult
    {
        int exit_status = -1;
        std::string out;
        std::string err;

        bool Succeeded() const { return exit_status == 0; }
    };

    class DeviceSession
    {
    public:
        virtual ~DeviceSession() = default;

        virtual const std::string &Address() const = 0;

        // Throws std::runtime_error when the channel itself fails.
        virtual CommandResult Execute(const std::string &command, std::chrono::milliseconds timeout) = 0;
    };

    enum class LoginStatus
    {
        Authenticated,
        Rejected,   // the device refused this credential
        Unreachable // transport or handshake failure, worth retrying
    };

    struct LoginOutcome
    {
        LoginStatus status = LoginStatus::Unreachable;
        std::unique_ptr<DeviceSession> session;
        std::string detail;
    };

    class SessionFactory
    {
    public:
        virtual ~SessionFactory() = default;
        virtual LoginOutcome Open(const std::string &address, const CredentialSecret &secret,
                                  std::chrono::milliseconds timeout) = 0;
    };

    // ---- templates ----

    enum class TemplateCategory
    {
        Parser,
        Inventory
    };

    struct TemplateRecord
    {
        int id = 0;
        std::string name;
        TemplateCategory category = TemplateCategory::Parser;
        std::string content;
    };

    class TemplateStore
    {
    public:
        virtual ~TemplateStore() = default;
        virtual std::optional<TemplateRecord> GetTemplate(int template_id) = 0;
    };
}
