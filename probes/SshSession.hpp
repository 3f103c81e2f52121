#pragma once

#include "../scan/Collaborators.hpp"

#include <mutex>
#include <string>
#include <libssh2.h>

namespace netscout::probes
{
    // Authenticated libssh2 session; each command runs on its own exec channel.
    class SshSession : public scan::DeviceSession
    {
    public:
        ~SshSession() override;

        SshSession(const SshSession &) = delete;
        SshSession &operator=(const SshSession &) = delete;

        const std::string &Address() const override { return m_address; }
        scan::CommandResult Execute(const std::string &command, std::chrono::milliseconds timeout) override;

    private:
        friend class SshSessionFactory;
        SshSession(std::string address, int sock, LIBSSH2_SESSION *session);

        std::string m_address;
        int m_sock;
        LIBSSH2_SESSION *m_session;
        std::mutex m_mutex;
    };

    class SshSessionFactory : public scan::SessionFactory
    {
    public:
        explicit SshSessionFactory(int port = 22);

        // Connect and handshake failures are Unreachable; an auth refusal is Rejected.
        scan::LoginOutcome Open(const std::string &address, const scan::CredentialSecret &secret,
                                std::chrono::milliseconds timeout) override;

    private:
        int m_port;
    };
}
