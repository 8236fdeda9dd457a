/**
 * rcctl - Error codes shared by the transport, the job tracker and the shell.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rcctl
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        MalformedPayload = 1,
        TransientNetwork = 2,
        JobUnknown = 3,
        StopNotAcknowledged = 4,
        DivisionUndefined = 5,
        NotFound = 6,
        DaemonError = 7,
        InvalidArgument = 8,
        ProcessError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    class RcError : public std::runtime_error
    {
    public:
        RcError(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace rcctl
