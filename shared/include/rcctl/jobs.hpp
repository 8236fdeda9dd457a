/**
 * rcctl - Job records reported by the daemon and their lifecycle state.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "rcctl/protocol.hpp"

namespace rcctl::jobs
{

    using protocol::JobId;

    enum class JobState : std::uint8_t
    {
        NotStarted,
        InProgress,
        Finished,
        Failed
    };

    std::string_view to_string(JobState state) noexcept;

    constexpr bool is_terminal(JobState state) noexcept
    {
        return state == JobState::Finished || state == JobState::Failed;
    }

    struct Timestamp
    {
        // Wall-clock reading as written by the daemon, not shifted by utc_offset.
        std::chrono::sys_seconds wall_time{};
        std::optional<std::chrono::minutes> utc_offset{};

        std::optional<std::chrono::sys_seconds> to_utc() const;

        bool operator==(const Timestamp &other) const = default;
    };

    // Drops fractional seconds and alphabetic zone suffixes, keeping numeric offsets.
    std::string normalize_timestamp(std::string_view raw);

    // Parses YYYY-MM-DDTHH:MM:SS[+-HH:MM] after normalization. Throws RcError(MalformedPayload).
    Timestamp parse_timestamp(std::string_view raw);

    std::string format_timestamp(const Timestamp &timestamp);

    struct TransferStats
    {
        std::uint64_t transferred_bytes{};
        std::uint64_t total_bytes{};
        std::string name;
        double speed{};
        double average_speed{};

        // Throws RcError(DivisionUndefined) when total_bytes is zero.
        double percentage() const;
    };

    struct JobRecord
    {
        JobId id{};
        Timestamp start_time{};
        std::optional<Timestamp> end_time{};
        std::string error;
        nlohmann::json output{};
        bool success{};
        bool finished{};
        std::optional<TransferStats> stats{};
    };

    JobState derive_state(const JobRecord &record) noexcept;
    JobState derive_state(const std::optional<JobRecord> &record) noexcept;

    JobRecord decode_job_record(const nlohmann::json &json);

    // Reads the first entry of the "transferring" array of a core/stats payload.
    std::optional<TransferStats> decode_transfer_stats(const nlohmann::json &json);

} // namespace rcctl::jobs
