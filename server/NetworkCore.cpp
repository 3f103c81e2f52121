#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <stdexcept>
#include <sys/socket.h>
#include <iostream>

#include "NetworkCore.hpp"
#include "Worker.hpp"
#include "../common/Messages.hpp"
#include <netinet/in.h>

namespace netscout::server
{
    void NetworkCore::LogOpenSSLErrors()
    {
        unsigned long code = 0;
        while ((code = ERR_get_error()) != 0)
        {
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            std::cerr << "[Server] OpenSSL: " << buf << std::endl;
        }
    }

    void NetworkCore::NonBlockingMode(int fd)
    {
        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    void NetworkCore::EpollControlAdd(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));

        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1)
        {
            throw std::runtime_error("Failed to add FD to epoll");
        }
    }

    void NetworkCore::EpollControlModify(int fd, uint32_t events)
    {
        struct epoll_event event;
        std::memset(&event, 0, sizeof(event));

        event.events = events;
        event.data.fd = fd;

        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_MOD, fd, &event) == -1)
        {
            std::cerr << "[Server] Warning: Failed to modify epoll interest for " << fd << std::endl;
        }
    }

    void NetworkCore::EpollControlRemove(int fd)
    {
        if (epoll_ctl(m_epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == -1)
        {
            std::cerr << "[Server] Warning: Failed to remove FD from epoll" << std::endl;
        }
    }

    void NetworkCore::DisconnectClient(int fd)
    {
        auto it = registry.find(fd);
        if (it == registry.end())
            return;

        if (it->second.ssl_handle)
        {
            if (it->second.is_handshake_complete)
                SSL_shutdown(it->second.ssl_handle);
            SSL_free(it->second.ssl_handle);
        }

        EpollControlRemove(fd);
        close(fd);
        registry.erase(it);
        std::cout << "[Server] Client " << fd << " disconnected." << std::endl;
    }

    void NetworkCore::HandleNewConnection()
    {
        while (true)
        {
            struct sockaddr_in clientAddress;
            socklen_t clientAddressLength = sizeof(clientAddress);
            int client_fd = accept(m_server_fd, reinterpret_cast<struct sockaddr *>(&clientAddress), &clientAddressLength);
            if (client_fd == -1)
            {
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    std::cerr << "[Server] accept failed: " << strerror(errno) << std::endl;
                return;
            }

            NonBlockingMode(client_fd);

            SSL *ssl_handle = SSL_new(m_ssl_ctx);
            if (!ssl_handle)
            {
                LogOpenSSLErrors();
                close(client_fd);
                continue;
            }
            SSL_set_fd(ssl_handle, client_fd);

            ClientContext &ctx = registry[client_fd];
            ctx.socketfd = client_fd;
            ctx.connection_id = ++m_next_connection_id;
            ctx.ssl_handle = ssl_handle;

            EpollControlAdd(client_fd, EPOLLIN);

            int ret = SSL_accept(ssl_handle);
            if (ret == 1)
            {
                ctx.is_handshake_complete = true;
                std::cout << "[Server] New connection accepted and handshake complete: " << client_fd << std::endl;
                continue;
            }

            int ssl_error = SSL_get_error(ssl_handle, ret);
            if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE)
            {
                std::cout << "[Server] New connection accepted, handshake pending: " << client_fd << std::endl;
            }
            else
            {
                std::cerr << "[Server] Fatal TLS handshake error on " << client_fd << ". Disconnecting." << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(client_fd);
            }
        }
    }

    void NetworkCore::HandleClientData(int fd)
    {
        auto found = registry.find(fd);
        if (found == registry.end())
            return;
        ClientContext &ctx = found->second;

        if (!ctx.is_handshake_complete)
        {
            int ret = SSL_accept(ctx.ssl_handle);
            if (ret != 1)
            {
                int err = SSL_get_error(ctx.ssl_handle, ret);
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    return;

                std::cerr << "[Server] TLS handshake failed for " << fd << ". Error: " << err << std::endl;
                LogOpenSSLErrors();
                DisconnectClient(fd);
                return;
            }
            ctx.is_handshake_complete = true;
            std::cout << "[Server] TLS handshake complete for client " << fd << std::endl;
        }

        uint8_t temp_buffer[4096];

        while (true)
        {
            int count = SSL_read(ctx.ssl_handle, temp_buffer, sizeof(temp_buffer));

            if (count > 0)
            {
                ctx.buff.Append(temp_buffer, static_cast<size_t>(count));
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, count);
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                break;

            DisconnectClient(fd);
            return;
        }

        while (auto frame = ctx.buff.NextFrame())
        {
            ProcessMessage(ctx, frame->type, std::move(frame->payload));
            if (registry.find(fd) == registry.end())
                return;
        }

        if (ctx.buff.IsCorrupt())
        {
            std::cerr << "[Server] Client " << fd << " sent a malformed frame. Disconnecting." << std::endl;
            DisconnectClient(fd);
        }
    }

    void NetworkCore::ProcessMessage(ClientContext &ctx, netscout::protocol::MessageType type, std::vector<uint8_t> payload)
    {
        using namespace netscout::protocol;

        std::cout << "[Client " << ctx.socketfd << "] Received Message Type: "
                  << static_cast<int>(type)
                  << " | Size: " << payload.size() << " bytes." << std::endl;

        if (!IsRequest(type))
        {
            SendNow(ctx, MessageType::ErrorResp, common::EncodeError("Unsupported message type"));
            return;
        }

        if (!m_worker)
        {
            SendNow(ctx, MessageType::ErrorResp, common::EncodeError("Server is not ready"));
            return;
        }

        m_worker->AddJob(ctx.socketfd, ctx.connection_id, type, std::move(payload));
    }

    void NetworkCore::SendNow(ClientContext &ctx, netscout::protocol::MessageType type, const std::vector<uint8_t> &payload)
    {
        std::vector<uint8_t> frame = netscout::protocol::BuildFrame(type, payload);
        ctx.outbound.insert(ctx.outbound.end(), frame.begin(), frame.end());
        FlushClient(ctx.socketfd);
    }

    void NetworkCore::UpdateInterest(ClientContext &ctx)
    {
        bool want_write = !ctx.outbound.empty();
        if (want_write == ctx.want_write)
            return;

        ctx.want_write = want_write;
        EpollControlModify(ctx.socketfd, want_write ? (EPOLLIN | EPOLLOUT) : EPOLLIN);
    }

    bool NetworkCore::FlushClient(int fd)
    {
        auto found = registry.find(fd);
        if (found == registry.end())
            return false;
        ClientContext &ctx = found->second;

        if (!ctx.is_handshake_complete)
            return true;

        while (!ctx.outbound.empty())
        {
            int n = SSL_write(ctx.ssl_handle, ctx.outbound.data(), static_cast<int>(ctx.outbound.size()));
            if (n > 0)
            {
                ctx.outbound.erase(ctx.outbound.begin(), ctx.outbound.begin() + n);
                continue;
            }

            int err = SSL_get_error(ctx.ssl_handle, n);
            if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                break;

            std::cerr << "[Server] Write to client " << fd << " failed. Disconnecting." << std::endl;
            DisconnectClient(fd);
            return false;
        }

        UpdateInterest(ctx);
        return true;
    }

    void NetworkCore::HandleWakeup()
    {
        uint64_t value = 0;
        while (read(m_wake_fd, &value, sizeof(value)) > 0)
        {
        }

        std::vector<Outgoing> pending;
        {
            std::lock_guard<std::mutex> lock(m_outgoing_mutex);
            pending.swap(m_outgoing);
        }

        for (auto &item : pending)
        {
            auto found = registry.find(item.fd);
            if (found == registry.end() || found->second.connection_id != item.connection_id)
                continue;

            ClientContext &ctx = found->second;
            ctx.outbound.insert(ctx.outbound.end(), item.frame.begin(), item.frame.end());
            FlushClient(item.fd);
        }
    }

    void NetworkCore::QueueResponse(int fd, uint64_t connection_id, netscout::protocol::MessageType type,
                                    const std::vector<uint8_t> &payload)
    {
        {
            std::lock_guard<std::mutex> lock(m_outgoing_mutex);
            m_outgoing.push_back({fd, connection_id, netscout::protocol::BuildFrame(type, payload)});
        }

        uint64_t one = 1;
        if (m_wake_fd != -1 && write(m_wake_fd, &one, sizeof(one)) < 0 && errno != EAGAIN)
            std::cerr << "[Server] Failed to wake event loop: " << strerror(errno) << std::endl;
    }

    void NetworkCore::Stop()
    {
        m_running.store(false);
        if (m_wake_fd != -1)
        {
            uint64_t one = 1;
            ssize_t ignored = write(m_wake_fd, &one, sizeof(one));
            (void)ignored;
        }
    }

    NetworkCore::NetworkCore(int port, std::string cert_path, std::string key_path)
        : m_server_fd(-1),
          m_epoll_fd(-1),
          m_wake_fd(-1),
          m_port(port),
          m_cert_path(std::move(cert_path)),
          m_key_path(std::move(key_path)),
          m_running(false),
          m_next_connection_id(0),
          m_ssl_ctx(nullptr),
          m_worker(nullptr)
    {
    }

    NetworkCore::~NetworkCore()
    {
        for (auto &it : registry)
        {
            if (it.second.ssl_handle)
                SSL_free(it.second.ssl_handle);
            close(it.first);
        }
        registry.clear();

        if (m_server_fd != -1)
            close(m_server_fd);
        if (m_wake_fd != -1)
            close(m_wake_fd);
        if (m_epoll_fd != -1)
            close(m_epoll_fd);
        if (m_ssl_ctx)
            SSL_CTX_free(m_ssl_ctx);
    }

    void NetworkCore::Init()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_server_method());
        if (m_ssl_ctx == nullptr)
        {
            throw std::runtime_error("Failed to create SSL Context. Is OpenSSL installed?");
        }
        SSL_CTX_set_mode(m_ssl_ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        if (SSL_CTX_use_certificate_file(m_ssl_ctx, m_cert_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load '" + m_cert_path + "'. Check NETSCOUT_CERT.");
        }

        if (SSL_CTX_use_PrivateKey_file(m_ssl_ctx, m_key_path.c_str(), SSL_FILETYPE_PEM) <= 0)
        {
            LogOpenSSLErrors();
            throw std::runtime_error("Failed to load '" + m_key_path + "'. Check NETSCOUT_KEY.");
        }

        if (!SSL_CTX_check_private_key(m_ssl_ctx))
        {
            throw std::runtime_error("Private Key does not match the Certificate!");
        }

        m_server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_server_fd == -1)
        {
            throw std::runtime_error("Failed to create socket.");
        }

        int opt = 1;
        if (setsockopt(m_server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0)
        {
            throw std::runtime_error("Failed to set SO_REUSEADDR.");
        }

        NonBlockingMode(m_server_fd);

        struct sockaddr_in serverAddress;
        std::memset(&serverAddress, 0, sizeof(serverAddress));
        serverAddress.sin_family = AF_INET;
        serverAddress.sin_port = htons(static_cast<uint16_t>(m_port));
        serverAddress.sin_addr.s_addr = INADDR_ANY;

        if (bind(m_server_fd, reinterpret_cast<struct sockaddr *>(&serverAddress), sizeof(serverAddress)) != 0)
        {
            throw std::runtime_error("Failed to bind server socket. Is the port taken?");
        }

        if ((listen(m_server_fd, SOMAXCONN)) != 0)
        {
            throw std::runtime_error("Failed to listen server socket.");
        }

        m_epoll_fd = epoll_create1(0);
        if (m_epoll_fd == -1)
        {
            throw std::runtime_error("Failed to create epoll file descriptor.");
        }

        m_wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wake_fd == -1)
        {
            throw std::runtime_error("Failed to create eventfd.");
        }

        EpollControlAdd(m_server_fd, EPOLLIN);
        EpollControlAdd(m_wake_fd, EPOLLIN);
    }

    void NetworkCore::Run()
    {
        m_running = true;

        std::cout << "[Server] Listening on port " << m_port << "..." << std::endl;

        struct epoll_event ev[128];
        int count = 0;
        while (m_running)
        {
            if ((count = epoll_wait(m_epoll_fd, ev, 128, -1)) == -1)
            {
                if (errno == EINTR)
                    continue;
                std::cerr << "[Server] epoll_wait failed: " << strerror(errno) << std::endl;
                break;
            }

            for (int i = 0; i < count; i++)
            {
                int current_fd = ev[i].data.fd;
                if (current_fd == m_server_fd)
                {
                    HandleNewConnection();
                }
                else if (current_fd == m_wake_fd)
                {
                    HandleWakeup();
                }
                else
                {
                    if (ev[i].events & (EPOLLERR | EPOLLHUP))
                    {
                        DisconnectClient(current_fd);
                        continue;
                    }
                    if (ev[i].events & EPOLLOUT)
                    {
                        if (!FlushClient(current_fd))
                            continue;
                    }
                    if (ev[i].events & EPOLLIN)
                        HandleClientData(current_fd);
                }
            }
        }

        std::cout << "[Server] Event loop stopped." << std::endl;
    }
}
