#include "CredentialTrial.hpp"

#include <exception>
#include <iostream>

namespace netscout::scan
{
    CredentialTrialEngine::CredentialTrialEngine(CredentialStore &credentials, SessionFactory &sessions,
                                                 std::chrono::milliseconds login_timeout, int attempts_per_credential)
        : m_credentials(credentials),
          m_sessions(sessions),
          m_login_timeout(login_timeout),
          m_attempts(attempts_per_credential < 1 ? 1 : attempts_per_credential)
    {
    }

    TrialOutcome CredentialTrialEngine::Authenticate(const std::string &address, const std::vector<int> &credential_ids)
    {
        TrialOutcome outcome;

        for (int id : credential_ids)
        {
            std::optional<CredentialSecret> secret;
            try
            {
                secret = m_credentials.Resolve(id);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Trial] Credential " << id << " could not be resolved: " << e.what() << "\n";
                continue;
            }

            if (!secret)
            {
                std::cerr << "[Trial] Credential " << id << " unavailable, skipping\n";
                continue;
            }

            for (int attempt = 1; attempt <= m_attempts; ++attempt)
            {
                ++outcome.attempts;

                LoginOutcome login;
                try
                {
                    login = m_sessions.Open(address, *secret, m_login_timeout);
                }
                catch (const std::exception &e)
                {
                    login.status = LoginStatus::Unreachable;
                    login.detail = e.what();
                }

                if (login.status == LoginStatus::Authenticated && login.session)
                {
                    std::cout << "[Trial] " << address << " authenticated with credential " << id << "\n";
                    outcome.credential_id = id;
                    outcome.session = std::move(login.session);
                    return outcome;
                }

                if (login.status == LoginStatus::Rejected)
                {
                    std::cout << "[Trial] " << address << " rejected credential " << id << "\n";
                    break;
                }

                std::cerr << "[Trial] " << address << " attempt " << attempt << "/" << m_attempts
                          << " with credential " << id << " failed: " << login.detail << "\n";
            }
        }

        return outcome;
    }
}
