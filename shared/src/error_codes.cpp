#include "rcctl/error_codes.hpp"

#include <array>

namespace rcctl
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::MalformedPayload, "malformed_payload"},
            {ErrorCode::TransientNetwork, "transient_network"},
            {ErrorCode::JobUnknown, "job_unknown"},
            {ErrorCode::StopNotAcknowledged, "stop_not_acknowledged"},
            {ErrorCode::DivisionUndefined, "division_undefined"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::DaemonError, "daemon_error"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::ProcessError, "process_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::DaemonError;
    }

    RcError::RcError(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

} // namespace rcctl
