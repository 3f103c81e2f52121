#include "SshSession.hpp"
#include "StreamDrain.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace netscout::probes
{
    namespace
    {
        std::once_flag g_libssh2_init;

        std::string LastError(LIBSSH2_SESSION *session)
        {
            char *msg = nullptr;
            libssh2_session_last_error(session, &msg, nullptr, 0);
            return msg ? std::string(msg) : std::string("unknown libssh2 error");
        }

        bool IsTransportError(int rc)
        {
            return rc == LIBSSH2_ERROR_TIMEOUT ||
                   rc == LIBSSH2_ERROR_SOCKET_SEND ||
                   rc == LIBSSH2_ERROR_SOCKET_RECV ||
                   rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
                   rc == LIBSSH2_ERROR_SOCKET_TIMEOUT;
        }

        // Bounded TCP connect; returns a blocking socket or -1 with errno set.
        int ConnectWithTimeout(const std::string &address, int port, std::chrono::milliseconds timeout)
        {
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(static_cast<uint16_t>(port));
            if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1)
            {
                errno = EINVAL;
                return -1;
            }

            int sock = socket(AF_INET, SOCK_STREAM, 0);
            if (sock < 0)
                return -1;

            int flags = fcntl(sock, F_GETFL, 0);
            fcntl(sock, F_SETFL, flags | O_NONBLOCK);

            int rc = connect(sock, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            if (rc < 0 && errno != EINPROGRESS)
            {
                int saved = errno;
                close(sock);
                errno = saved;
                return -1;
            }

            if (rc < 0)
            {
                pollfd pfd{};
                pfd.fd = sock;
                pfd.events = POLLOUT;
                if (poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
                {
                    close(sock);
                    errno = ETIMEDOUT;
                    return -1;
                }

                int so_error = 0;
                socklen_t len = sizeof(so_error);
                getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len);
                if (so_error != 0)
                {
                    close(sock);
                    errno = so_error;
                    return -1;
                }
            }

            fcntl(sock, F_SETFL, flags);
            return sock;
        }

        // Answers every keyboard-interactive prompt with the password stashed
        // in the session abstract. libssh2 frees the responses.
        LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(KbdintResponder)
        {
            (void)name;
            (void)name_len;
            (void)instruction;
            (void)instruction_len;
            (void)prompts;

            const auto *password = static_cast<const std::string *>(*abstract);
            for (int i = 0; i < num_prompts; ++i)
            {
                responses[i].text = strdup(password ? password->c_str() : "");
                responses[i].length = password ? static_cast<unsigned int>(password->size()) : 0;
            }
        }

        constexpr size_t kMaxCommandOutput = 1024 * 1024;

        // Waits for the direction libssh2 is blocked on; false once the deadline passes.
        bool WaitForSocket(LIBSSH2_SESSION *session, int sock, std::chrono::steady_clock::time_point deadline)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return false;

            pollfd pfd{};
            pfd.fd = sock;
            int directions = libssh2_session_block_directions(session);
            if (directions & LIBSSH2_SESSION_BLOCK_INBOUND)
                pfd.events |= POLLIN;
            if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND)
                pfd.events |= POLLOUT;
            if (pfd.events == 0)
                pfd.events = POLLIN;

            int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0 && errno == EINTR)
                return true;
            return rc > 0;
        }

        class ChannelSource : public StreamSource
        {
        public:
            ChannelSource(LIBSSH2_SESSION *session, int sock, LIBSSH2_CHANNEL *channel)
                : m_session(session), m_sock(sock), m_channel(channel) {}

            long Read(int stream, char *buf, size_t len) override
            {
                ssize_t n = libssh2_channel_read_ex(m_channel, stream == kStderr ? SSH_EXTENDED_DATA_STDERR : 0, buf, len);
                if (n == LIBSSH2_ERROR_EAGAIN)
                    return kWouldBlock;
                if (n < 0)
                    throw std::runtime_error("read failed: " + LastError(m_session));
                return static_cast<long>(n);
            }

            bool AtEof() override { return libssh2_channel_eof(m_channel) != 0; }

            bool Wait(std::chrono::steady_clock::time_point deadline) override
            {
                return WaitForSocket(m_session, m_sock, deadline);
            }

        private:
            LIBSSH2_SESSION *m_session;
            int m_sock;
            LIBSSH2_CHANNEL *m_channel;
        };

        void Discard(LIBSSH2_SESSION *session, int sock)
        {
            if (session)
            {
                libssh2_session_disconnect(session, "netscout closing");
                libssh2_session_free(session);
            }
            if (sock >= 0)
                close(sock);
        }
    }

    // ---- session ----

    SshSession::SshSession(std::string address, int sock, LIBSSH2_SESSION *session)
        : m_address(std::move(address)), m_sock(sock), m_session(session)
    {
    }

    SshSession::~SshSession()
    {
        Discard(m_session, m_sock);
    }

    scan::CommandResult SshSession::Execute(const std::string &command, std::chrono::milliseconds timeout)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        libssh2_session_set_timeout(m_session, static_cast<long>(timeout.count()));

        LIBSSH2_CHANNEL *channel = libssh2_channel_open_session(m_session);
        if (!channel)
            throw std::runtime_error("channel open failed: " + LastError(m_session));

        if (libssh2_channel_exec(channel, command.c_str()) != 0)
        {
            std::string err = LastError(m_session);
            libssh2_channel_free(channel);
            throw std::runtime_error("exec failed: " + err);
        }

        ChannelSource source(m_session, m_sock, channel);
        DrainedOutput drained;
        libssh2_session_set_blocking(m_session, 0);
        try
        {
            drained = DrainStreams(source, kMaxCommandOutput, std::chrono::steady_clock::now() + timeout);
        }
        catch (const std::runtime_error &)
        {
            libssh2_session_set_blocking(m_session, 1);
            libssh2_channel_free(channel);
            throw;
        }
        libssh2_session_set_blocking(m_session, 1);

        if (drained.truncated)
            std::cerr << "[Ssh] " << m_address << ": output of '" << command << "' cut at "
                      << kMaxCommandOutput << " bytes" << std::endl;

        scan::CommandResult result;
        result.out = std::move(drained.out);
        result.err = std::move(drained.err);

        libssh2_channel_close(channel);
        libssh2_channel_wait_closed(channel);
        result.exit_status = libssh2_channel_get_exit_status(channel);
        libssh2_channel_free(channel);
        return result;
    }

    // ---- factory ----

    SshSessionFactory::SshSessionFactory(int port) : m_port(port)
    {
        std::call_once(g_libssh2_init, []
                       {
                           if (libssh2_init(0) != 0)
                               throw std::runtime_error("libssh2_init failed"); });
    }

    scan::LoginOutcome SshSessionFactory::Open(const std::string &address, const scan::CredentialSecret &secret,
                                               std::chrono::milliseconds timeout)
    {
        scan::LoginOutcome outcome;
        outcome.status = scan::LoginStatus::Unreachable;

        int sock = ConnectWithTimeout(address, m_port, timeout);
        if (sock < 0)
        {
            outcome.detail = std::string("connect failed: ") + std::strerror(errno);
            return outcome;
        }

        LIBSSH2_SESSION *session = libssh2_session_init();
        if (!session)
        {
            close(sock);
            outcome.detail = "libssh2_session_init failed";
            return outcome;
        }

        libssh2_session_set_blocking(session, 1);
        libssh2_session_set_timeout(session, static_cast<long>(timeout.count()));

        if (libssh2_session_handshake(session, sock) != 0)
        {
            outcome.detail = "handshake failed: " + LastError(session);
            Discard(session, sock);
            return outcome;
        }

        const std::string &user = secret.username;
        char *methods = libssh2_userauth_list(session, user.c_str(), static_cast<unsigned int>(user.size()));

        int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
        if (!methods)
        {
            if (libssh2_userauth_authenticated(session))
                rc = 0;
            else if (IsTransportError(libssh2_session_last_errno(session)))
                rc = libssh2_session_last_errno(session);
        }
        else
        {
            if (std::strstr(methods, "password"))
                rc = libssh2_userauth_password(session, user.c_str(), secret.password.c_str());

            if (rc != 0 && !IsTransportError(rc) && std::strstr(methods, "keyboard-interactive"))
            {
                void **abstract = libssh2_session_abstract(session);
                *abstract = const_cast<std::string *>(&secret.password);
                rc = libssh2_userauth_keyboard_interactive(session, user.c_str(), &KbdintResponder);
                *abstract = nullptr;
            }
        }

        if (rc != 0)
        {
            outcome.status = IsTransportError(rc) ? scan::LoginStatus::Unreachable : scan::LoginStatus::Rejected;
            outcome.detail = "authentication failed: " + LastError(session);
            Discard(session, sock);
            return outcome;
        }

        outcome.status = scan::LoginStatus::Authenticated;
        outcome.session.reset(new SshSession(address, sock, session));
        return outcome;
    }
}
