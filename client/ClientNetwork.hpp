#pragma once

#include <string>
#include <vector>
#include <optional>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include "../common/FrameBuffer.hpp"
#include "../common/protocol.hpp"

namespace netscout::client
{
    // Blocking TLS connection to netscoutd: one request, one response frame.
    class ClientNetwork
    {
    private:
        std::string m_host;
        int m_port;
        std::string m_ca_file;
        int m_socket_fd;

        SSL_CTX *m_ssl_ctx;
        SSL *m_ssl_handle;

        netscout::common::FrameBuffer m_in_buffer;

        void InitSSL();
        void CleanupSSL();
        bool WriteAll(const std::vector<uint8_t> &data);

    public:
        // An empty ca_file disables certificate verification.
        ClientNetwork(std::string host, int port, std::string ca_file = "");
        ~ClientNetwork();

        ClientNetwork(const ClientNetwork &) = delete;
        ClientNetwork &operator=(const ClientNetwork &) = delete;

        bool Connect();
        void Disconnect();
        bool IsConnected() const { return m_socket_fd != -1 && m_ssl_handle != nullptr; }

        // nullopt on a transport failure or a malformed reply.
        std::optional<netscout::common::Frame> Request(netscout::protocol::MessageType type,
                                                       const std::vector<uint8_t> &payload);
    };
}
