#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <sys/epoll.h>
#include <vector>

#include <openssl/ssl.h>
#include <openssl/err.h>

#include "../common/FrameBuffer.hpp"
#include "../common/protocol.hpp"

namespace netscout::server
{
    class Worker;

    struct ClientContext
    {
        int socketfd = -1;
        uint64_t connection_id = 0;
        SSL *ssl_handle = nullptr;
        netscout::common::FrameBuffer buff;
        std::vector<uint8_t> outbound;
        bool is_handshake_complete = false;
        bool want_write = false;
    };

    // Single-threaded epoll TLS server. Requests go to the worker; responses
    // come back through QueueResponse() and are written by the event loop.
    class NetworkCore
    {
    private:
        int m_server_fd;
        int m_epoll_fd;
        int m_wake_fd;
        int m_port;
        std::string m_cert_path;
        std::string m_key_path;
        std::atomic<bool> m_running;
        std::map<int, ClientContext> registry;
        uint64_t m_next_connection_id;

        SSL_CTX *m_ssl_ctx;
        Worker *m_worker;

        struct Outgoing
        {
            int fd;
            uint64_t connection_id;
            std::vector<uint8_t> frame;
        };
        std::mutex m_outgoing_mutex;
        std::vector<Outgoing> m_outgoing;

        void LogOpenSSLErrors();

        void NonBlockingMode(int fd);
        void EpollControlAdd(int fd, uint32_t events);
        void EpollControlModify(int fd, uint32_t events);
        void EpollControlRemove(int fd);
        void DisconnectClient(int fd);

        void HandleNewConnection();
        void HandleClientData(int fd);
        void HandleWakeup();
        bool FlushClient(int fd);
        void UpdateInterest(ClientContext &ctx);

        void ProcessMessage(ClientContext &ctx, netscout::protocol::MessageType type, std::vector<uint8_t> payload);
        void SendNow(ClientContext &ctx, netscout::protocol::MessageType type, const std::vector<uint8_t> &payload);

    public:
        NetworkCore(int port, std::string cert_path, std::string key_path);
        ~NetworkCore();

        NetworkCore(const NetworkCore &) = delete;
        NetworkCore &operator=(const NetworkCore &) = delete;

        void SetWorker(Worker *worker) { m_worker = worker; }

        void Init();
        void Run();

        // Safe from any thread and from a signal handler.
        void Stop();

        // Called by the worker; dropped if the connection has gone away.
        void QueueResponse(int fd, uint64_t connection_id, netscout::protocol::MessageType type,
                           const std::vector<uint8_t> &payload);
    };
}
