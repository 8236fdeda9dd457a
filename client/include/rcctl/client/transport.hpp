#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "rcctl/error_codes.hpp"
#include "rcctl/protocol.hpp"

namespace rcctl::client
{

    struct Response
    {
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};

        bool ok() const noexcept { return error == ErrorCode::Ok; }
    };

    // Single request/response capability of the daemon. Implementations classify
    // failures into Response::error instead of throwing.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        virtual Response request(rcctl::protocol::Endpoint endpoint,
                                 const nlohmann::json &params = nlohmann::json::object()) = 0;
    };

    // Payload of a successful response; throws RcError carrying the response's code otherwise.
    const nlohmann::json &expect_ok(const Response &response, rcctl::protocol::Endpoint endpoint);

} // namespace rcctl::client
