#pragma once

#include "Collaborators.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netscout::scan
{
    struct TrialOutcome
    {
        std::optional<int> credential_id; // set only on success
        std::unique_ptr<DeviceSession> session;
        int attempts = 0;                 // logins actually attempted

        bool Succeeded() const { return credential_id.has_value() && session != nullptr; }
    };

    // Walks the caller's credential list in order and stops at the first one
    // that logs in. Transport failures are retried up to the attempt limit;
    // a rejection moves straight to the next credential.
    class CredentialTrialEngine
    {
    public:
        CredentialTrialEngine(CredentialStore &credentials, SessionFactory &sessions,
                              std::chrono::milliseconds login_timeout, int attempts_per_credential);

        TrialOutcome Authenticate(const std::string &address, const std::vector<int> &credential_ids);

    private:
        CredentialStore &m_credentials;
        SessionFactory &m_sessions;
        std::chrono::milliseconds m_login_timeout;
        int m_attempts;
    };
}
