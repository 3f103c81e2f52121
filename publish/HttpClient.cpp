#include "HttpClient.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace netscout::publish
{
    namespace
    {
        std::once_flag g_curl_init;

        struct CurlDeleter
        {
            void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
        };

        struct SlistDeleter
        {
            void operator()(curl_slist *list) const { curl_slist_free_all(list); }
        };

        std::string Trim(const std::string &s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string::npos)
                return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        size_t CollectBody(char *data, size_t size, size_t count, void *user)
        {
            static_cast<std::string *>(user)->append(data, size * count);
            return size * count;
        }

        // Called once per header line; a new status line resets what came before
        // (redirect or 100-continue responses).
        size_t CollectHeader(char *data, size_t size, size_t count, void *user)
        {
            auto *headers = static_cast<std::map<std::string, std::string> *>(user);
            std::string line(data, size * count);

            if (line.rfind("HTTP/", 0) == 0)
            {
                headers->clear();
                return size * count;
            }

            auto colon = line.find(':');
            if (colon != std::string::npos)
            {
                std::string name = Trim(line.substr(0, colon));
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                (*headers)[name] = Trim(line.substr(colon + 1));
            }
            return size * count;
        }
    }

    HttpClient::HttpClient(std::chrono::milliseconds timeout, bool verify_tls)
        : m_timeout(timeout), m_verify_tls(verify_tls)
    {
        std::call_once(g_curl_init, []
                       {
                           if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                               throw std::runtime_error("curl_global_init failed"); });
    }

    HttpResponse HttpClient::Post(const std::string &url, const std::map<std::string, std::string> &headers,
                                  const std::string &body)
    {
        std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
        if (!curl)
            throw std::runtime_error("curl_easy_init failed");

        curl_slist *raw_list = nullptr;
        for (const auto &header : headers)
        {
            curl_slist *next = curl_slist_append(raw_list, (header.first + ": " + header.second).c_str());
            if (!next)
            {
                curl_slist_free_all(raw_list);
                throw std::runtime_error("out of memory building request headers");
            }
            raw_list = next;
        }
        std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);

        HttpResponse response;
        char error_buffer[CURL_ERROR_SIZE] = {0};

        CURL *handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(m_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, m_verify_tls ? 1L : 0L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, m_verify_tls ? 2L : 0L);
        curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, CollectBody);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, CollectHeader);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

        CURLcode rc = curl_easy_perform(handle);
        if (rc != CURLE_OK)
            throw std::runtime_error(error_buffer[0] ? std::string(error_buffer) : std::string(curl_easy_strerror(rc)));

        long status = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);
        return response;
    }
}
