#include "rcctl/client/http_transport.hpp"

#include <algorithm>
#include <cctype>

#include "rcctl/error_codes.hpp"
#include "rcctl/protocol.hpp"

namespace rcctl::client
{

    namespace
    {

        std::string to_lower(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        void ensure_curl_initialized()
        {
            static const CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
            if (init != CURLE_OK)
            {
                throw RcError(ErrorCode::TransientNetwork,
                              std::string("curl_global_init failed: ") + curl_easy_strerror(init));
            }
        }

    } // namespace

    Response classify_reply(long status, const std::string &body)
    {
        const auto text = trim(body);
        if (status >= 200 && status < 300)
        {
            if (text.empty())
            {
                return Response{};
            }
            try
            {
                return Response{ErrorCode::Ok, {}, nlohmann::json::parse(text)};
            }
            catch (const nlohmann::json::parse_error &ex)
            {
                return Response{ErrorCode::MalformedPayload, ex.what(), nlohmann::json::object()};
            }
        }

        rcctl::protocol::DaemonErrorBody error_body;
        nlohmann::json payload = nlohmann::json::object();
        try
        {
            payload = nlohmann::json::parse(text);
            if (payload.is_object())
            {
                error_body = payload.get<rcctl::protocol::DaemonErrorBody>();
            }
        }
        catch (const nlohmann::json::exception &)
        {
            // Proxies and older daemons answer with plain text.
            error_body.error = text;
            payload = nlohmann::json::object();
        }

        std::string message = error_body.error.empty() ? "HTTP " + std::to_string(status) : error_body.error;
        const bool not_found = status == 404 || to_lower(message).find("not found") != std::string::npos;
        return Response{not_found ? ErrorCode::NotFound : ErrorCode::DaemonError, std::move(message),
                        std::move(payload)};
    }

    Response classify_curl_error(CURLcode code, const std::string &detail)
    {
        switch (code)
        {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return Response{ErrorCode::TransientNetwork, detail, nlohmann::json::object()};
        case CURLE_WEIRD_SERVER_REPLY:
            return Response{ErrorCode::MalformedPayload, detail, nlohmann::json::object()};
        case CURLE_URL_MALFORMAT:
            return Response{ErrorCode::InvalidArgument, detail, nlohmann::json::object()};
        default:
            return Response{ErrorCode::DaemonError, detail, nlohmann::json::object()};
        }
    }

    HttpTransport::HttpTransport(std::string host, std::uint16_t port, std::optional<Credentials> credentials,
                                 std::chrono::milliseconds timeout, Logger logger)
        : base_url_("http://" + host + ":" + std::to_string(port) + "/"),
          logger_(std::move(logger))
    {
        ensure_curl_initialized();
        curl_ = curl_easy_init();
        if (!curl_)
        {
            throw RcError(ErrorCode::TransientNetwork, "curl_easy_init failed");
        }

        headers_ = curl_slist_append(headers_, "Content-Type: application/json");
        headers_ = curl_slist_append(headers_, "Accept: application/json");

        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &HttpTransport::append_body);
        curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, error_buffer_.data());
        if (credentials)
        {
            userpwd_ = credentials->username + ":" + credentials->password;
            curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
            curl_easy_setopt(curl_, CURLOPT_USERPWD, userpwd_->c_str());
        }
    }

    HttpTransport::~HttpTransport()
    {
        if (curl_)
        {
            curl_easy_cleanup(curl_);
        }
        curl_slist_free_all(headers_);
    }

    std::size_t HttpTransport::append_body(char *data, std::size_t size, std::size_t count, void *userdata)
    {
        auto *body = static_cast<std::string *>(userdata);
        body->append(data, size * count);
        return size * count;
    }

    Response HttpTransport::request(rcctl::protocol::Endpoint endpoint, const nlohmann::json &params)
    {
        const std::string url = base_url_ + std::string(rcctl::protocol::to_string(endpoint));
        const auto payload = params.dump();
        std::string reply;

        error_buffer_[0] = '\0';
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &reply);

        const CURLcode result = curl_easy_perform(curl_);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, nullptr);
        if (result != CURLE_OK)
        {
            const std::string detail = error_buffer_[0] != '\0' ? error_buffer_.data() : curl_easy_strerror(result);
            logger_.warn("http", "POST ", url, " failed: ", detail);
            return classify_curl_error(result, detail);
        }

        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        auto response = classify_reply(status, reply);
        if (response.ok())
        {
            logger_.log("http", "POST ", url, " -> ", status);
        }
        else
        {
            logger_.warn("http", "POST ", url, " -> ", status, " ", rcctl::to_string(response.error), ": ",
                         response.message);
        }
        return response;
    }

} // namespace rcctl::client
