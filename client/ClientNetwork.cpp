#include "ClientNetwork.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <unistd.h>
#include <netdb.h>
#include <sys/socket.h>
#include <poll.h>

namespace netscout::client
{
    namespace
    {
        constexpr int kIoTimeoutMs = 30000;

        bool wait_fd(int fd, short events, int timeout_ms = kIoTimeoutMs)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = events;

            int r = poll(&pfd, 1, timeout_ms);
            return r > 0;
        }
    }

    ClientNetwork::ClientNetwork(std::string host, int port, std::string ca_file)
        : m_host(std::move(host)), m_port(port), m_ca_file(std::move(ca_file)), m_socket_fd(-1), m_ssl_ctx(nullptr), m_ssl_handle(nullptr)
    {
        InitSSL();
    }

    ClientNetwork::~ClientNetwork()
    {
        Disconnect();
        CleanupSSL();
    }

    void ClientNetwork::InitSSL()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("Unable to create SSL context");
        }

        if (m_ca_file.empty())
        {
            SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
            return;
        }

        if (SSL_CTX_load_verify_locations(m_ssl_ctx, m_ca_file.c_str(), nullptr) <= 0)
        {
            ERR_print_errors_fp(stderr);
            throw std::runtime_error("Failed to load CA file " + m_ca_file);
        }
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_PEER, nullptr);
    }

    void ClientNetwork::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    bool ClientNetwork::Connect()
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo *result = nullptr;
        std::string service = std::to_string(m_port);
        int rc = getaddrinfo(m_host.c_str(), service.c_str(), &hints, &result);
        if (rc != 0)
        {
            std::cerr << "[Client] Cannot resolve " << m_host << ": " << gai_strerror(rc) << std::endl;
            return false;
        }
        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(result, freeaddrinfo);

        for (addrinfo *ai = result; ai; ai = ai->ai_next)
        {
            m_socket_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (m_socket_fd < 0)
                continue;
            if (connect(m_socket_fd, ai->ai_addr, ai->ai_addrlen) == 0)
                break;
            close(m_socket_fd);
            m_socket_fd = -1;
        }

        if (m_socket_fd < 0)
        {
            perror("Connection failed");
            return false;
        }

        m_ssl_handle = SSL_new(m_ssl_ctx);
        if (!m_ssl_handle)
        {
            ERR_print_errors_fp(stderr);
            Disconnect();
            return false;
        }
        SSL_set_fd(m_ssl_handle, m_socket_fd);
        SSL_set_tlsext_host_name(m_ssl_handle, m_host.c_str());

        if (SSL_connect(m_ssl_handle) <= 0)
        {
            ERR_print_errors_fp(stderr);
            std::cerr << "[Client] TLS handshake failed." << std::endl;
            Disconnect();
            return false;
        }

        return true;
    }

    void ClientNetwork::Disconnect()
    {
        if (m_ssl_handle)
        {
            SSL_shutdown(m_ssl_handle);
            SSL_free(m_ssl_handle);
            m_ssl_handle = nullptr;
        }
        if (m_socket_fd != -1)
        {
            close(m_socket_fd);
            m_socket_fd = -1;
        }
        m_in_buffer.Clear();
    }

    bool ClientNetwork::WriteAll(const std::vector<uint8_t> &data)
    {
        size_t off = 0;
        while (off < data.size())
        {
            int n = SSL_write(m_ssl_handle, data.data() + off, static_cast<int>(data.size() - off));
            if (n > 0)
            {
                off += static_cast<size_t>(n);
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(m_socket_fd, POLLIN))
                    return false;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(m_socket_fd, POLLOUT))
                    return false;
                continue;
            }

            return false;
        }
        return true;
    }

    std::optional<netscout::common::Frame> ClientNetwork::Request(netscout::protocol::MessageType type,
                                                                  const std::vector<uint8_t> &payload)
    {
        if (!IsConnected())
            return std::nullopt;

        if (!WriteAll(netscout::protocol::BuildFrame(type, payload)))
        {
            std::cerr << "[Client] Failed to send request." << std::endl;
            Disconnect();
            return std::nullopt;
        }

        uint8_t tmp[4096];
        while (true)
        {
            if (auto frame = m_in_buffer.NextFrame())
                return frame;

            if (m_in_buffer.IsCorrupt())
            {
                std::cerr << "[Client] Server sent a malformed frame." << std::endl;
                Disconnect();
                return std::nullopt;
            }

            int n = SSL_read(m_ssl_handle, tmp, sizeof(tmp));
            if (n > 0)
            {
                m_in_buffer.Append(tmp, static_cast<size_t>(n));
                continue;
            }

            int err = SSL_get_error(m_ssl_handle, n);
            if (err == SSL_ERROR_WANT_READ)
            {
                if (!wait_fd(m_socket_fd, POLLIN))
                    break;
                continue;
            }
            if (err == SSL_ERROR_WANT_WRITE)
            {
                if (!wait_fd(m_socket_fd, POLLOUT))
                    break;
                continue;
            }

            std::cerr << (err == SSL_ERROR_ZERO_RETURN ? "[Client] Server closed connection."
                                                       : "[Client] SSL_read fatal error.")
                      << std::endl;
            break;
        }

        Disconnect();
        return std::nullopt;
    }
}
