#pragma once

#include <chrono>
#include <map>
#include <string>

namespace netscout::publish
{
    struct HttpResponse
    {
        int status = 0;
        std::map<std::string, std::string> headers; // lower-cased names
        std::string body;
    };

    // Blocking libcurl requests, limited to http and https.
    class HttpClient
    {
    public:
        explicit HttpClient(std::chrono::milliseconds timeout = std::chrono::seconds(15), bool verify_tls = true);

        // Throws std::runtime_error on connect, TLS or protocol failure.
        HttpResponse Post(const std::string &url, const std::map<std::string, std::string> &headers,
                          const std::string &body);

    private:
        std::chrono::milliseconds m_timeout;
        bool m_verify_tls;
    };
}
