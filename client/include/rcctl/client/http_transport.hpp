#pragma once

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "rcctl/client/config.hpp"
#include "rcctl/client/logger.hpp"
#include "rcctl/client/transport.hpp"

namespace rcctl::client
{

    // Response for a completed HTTP exchange: 2xx JSON (an empty body reads as {})
    // or the daemon's error body for anything else.
    Response classify_reply(long status, const std::string &body);

    // Response for an exchange libcurl could not complete.
    Response classify_curl_error(CURLcode code, const std::string &detail);

    // JSON-over-HTTP transport to the daemon. One easy handle per transport, so
    // libcurl keeps the connection alive between requests.
    class HttpTransport : public Transport
    {
    public:
        HttpTransport(std::string host, std::uint16_t port, std::optional<Credentials> credentials,
                      std::chrono::milliseconds timeout, Logger logger);
        ~HttpTransport() override;

        HttpTransport(const HttpTransport &) = delete;
        HttpTransport &operator=(const HttpTransport &) = delete;

        Response request(rcctl::protocol::Endpoint endpoint,
                         const nlohmann::json &params = nlohmann::json::object()) override;

    private:
        static std::size_t append_body(char *data, std::size_t size, std::size_t count, void *userdata);

        std::string base_url_;
        std::optional<std::string> userpwd_;
        Logger logger_;
        CURL *curl_{nullptr};
        curl_slist *headers_{nullptr};
        std::array<char, CURL_ERROR_SIZE> error_buffer_{};
    };

} // namespace rcctl::client
