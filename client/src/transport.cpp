#include "rcctl/client/transport.hpp"

namespace rcctl::client
{

    const nlohmann::json &expect_ok(const Response &response, rcctl::protocol::Endpoint endpoint)
    {
        if (!response.ok())
        {
            std::string message(rcctl::protocol::to_string(endpoint));
            message += ": ";
            message += response.message.empty() ? std::string(rcctl::to_string(response.error)) : response.message;
            throw RcError(response.error, message);
        }
        return response.payload;
    }

} // namespace rcctl::client
