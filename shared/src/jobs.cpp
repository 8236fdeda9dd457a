#include "rcctl/jobs.hpp"

#include <array>
#include <iomanip>
#include <regex>
#include <sstream>

#include "rcctl/error_codes.hpp"

namespace rcctl::jobs
{

    namespace
    {

        struct JobStateMapping
        {
            JobState state;
            std::string_view label;
        };

        constexpr std::array<JobStateMapping, 4> kJobStateMappings{{
            {JobState::NotStarted, "NOT_STARTED"},
            {JobState::InProgress, "IN_PROGRESS"},
            {JobState::Finished, "FINISHED"},
            {JobState::Failed, "FAILED"},
        }};

        const std::regex &timestamp_deviation_pattern()
        {
            static const std::regex pattern(
                R"(([0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2})(\.[0-9]*)?([+-][0-9]{2}:[0-9]{2}|[A-Za-z]+)?)");
            return pattern;
        }

        const std::regex &timestamp_pattern()
        {
            static const std::regex pattern(
                R"(^([0-9]{4})-([0-9]{2})-([0-9]{2})T([0-9]{2}):([0-9]{2}):([0-9]{2})(?:([+-])([0-9]{2}):([0-9]{2}))?$)");
            return pattern;
        }

        [[noreturn]] void malformed(const std::string &message)
        {
            throw RcError(ErrorCode::MalformedPayload, message);
        }

        const nlohmann::json &require(const nlohmann::json &json, const char *field)
        {
            const auto it = json.find(field);
            if (it == json.end())
            {
                malformed(std::string("job status is missing '") + field + "'");
            }
            return *it;
        }

        bool require_bool(const nlohmann::json &json, const char *field)
        {
            const auto &value = require(json, field);
            if (!value.is_boolean())
            {
                malformed(std::string("job status field '") + field + "' is not a boolean");
            }
            return value.get<bool>();
        }

        // The daemon reports an unset time as Go's zero time.
        bool is_zero_time(const Timestamp &timestamp)
        {
            using namespace std::chrono;
            const sys_seconds zero = sys_days{year{1} / January / day{1}};
            return timestamp.wall_time == zero &&
                   (!timestamp.utc_offset || *timestamp.utc_offset == minutes{0});
        }

        std::optional<Timestamp> decode_end_time(const nlohmann::json &value)
        {
            if (value.is_null())
            {
                return std::nullopt;
            }
            if (!value.is_string())
            {
                malformed("job status field 'endTime' is not a string");
            }
            const auto text = value.get<std::string>();
            if (text.empty())
            {
                return std::nullopt;
            }
            auto parsed = parse_timestamp(text);
            if (is_zero_time(parsed))
            {
                return std::nullopt;
            }
            return parsed;
        }

        const nlohmann::json &stats_field(const nlohmann::json &entry, const char *field)
        {
            const auto it = entry.find(field);
            if (it == entry.end() || !it->is_number())
            {
                malformed(std::string("transfer stats entry has no numeric '") + field + "'");
            }
            return *it;
        }

        // Sizes the daemon cannot determine are reported as -1.
        std::uint64_t byte_count(const nlohmann::json &entry, const char *field)
        {
            const auto value = stats_field(entry, field).get<std::int64_t>();
            return value < 0 ? 0 : static_cast<std::uint64_t>(value);
        }

    } // namespace

    std::string_view to_string(JobState state) noexcept
    {
        for (const auto &mapping : kJobStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<std::chrono::sys_seconds> Timestamp::to_utc() const
    {
        if (!utc_offset)
        {
            return std::nullopt;
        }
        return wall_time - *utc_offset;
    }

    std::string normalize_timestamp(std::string_view raw)
    {
        const std::string input(raw);
        std::smatch match;
        if (!std::regex_search(input, match, timestamp_deviation_pattern()))
        {
            return input;
        }
        std::string result = match.prefix().str();
        result += match[1].str();
        if (match[3].matched)
        {
            const auto zone = match[3].str();
            if (zone.front() == '+' || zone.front() == '-')
            {
                result += zone;
            }
        }
        result += match.suffix().str();
        return result;
    }

    Timestamp parse_timestamp(std::string_view raw)
    {
        using namespace std::chrono;

        const auto normalized = normalize_timestamp(raw);
        std::smatch match;
        if (!std::regex_match(normalized, match, timestamp_pattern()))
        {
            malformed("unparseable timestamp: " + std::string(raw));
        }

        const year_month_day date{year{std::stoi(match[1].str())},
                                  month{static_cast<unsigned>(std::stoi(match[2].str()))},
                                  day{static_cast<unsigned>(std::stoi(match[3].str()))}};
        const auto hour = std::stoi(match[4].str());
        const auto minute = std::stoi(match[5].str());
        const auto second = std::stoi(match[6].str());
        if (!date.ok() || hour > 23 || minute > 59 || second > 59)
        {
            malformed("timestamp out of range: " + std::string(raw));
        }

        Timestamp timestamp;
        timestamp.wall_time = sys_days{date} + hours{hour} + minutes{minute} + seconds{second};
        if (match[7].matched)
        {
            const auto offset_hours = std::stoi(match[8].str());
            const auto offset_minutes = std::stoi(match[9].str());
            if (offset_hours > 23 || offset_minutes > 59)
            {
                malformed("timestamp offset out of range: " + std::string(raw));
            }
            minutes offset{offset_hours * 60 + offset_minutes};
            timestamp.utc_offset = match[7].str() == "-" ? -offset : offset;
        }
        return timestamp;
    }

    std::string format_timestamp(const Timestamp &timestamp)
    {
        using namespace std::chrono;

        const auto day_point = floor<days>(timestamp.wall_time);
        const year_month_day date{day_point};
        const hh_mm_ss time{timestamp.wall_time - day_point};

        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year()) << '-' << std::setw(2)
            << static_cast<unsigned>(date.month()) << '-' << std::setw(2) << static_cast<unsigned>(date.day()) << 'T'
            << std::setw(2) << time.hours().count() << ':' << std::setw(2) << time.minutes().count() << ':'
            << std::setw(2) << time.seconds().count();
        if (timestamp.utc_offset)
        {
            const auto total = timestamp.utc_offset->count();
            const auto magnitude = total < 0 ? -total : total;
            oss << (total < 0 ? '-' : '+') << std::setw(2) << magnitude / 60 << ':' << std::setw(2) << magnitude % 60;
        }
        return oss.str();
    }

    double TransferStats::percentage() const
    {
        if (total_bytes == 0)
        {
            throw RcError(ErrorCode::DivisionUndefined, "transfer of '" + name + "' has no known size");
        }
        return static_cast<double>(transferred_bytes) / static_cast<double>(total_bytes);
    }

    JobState derive_state(const JobRecord &record) noexcept
    {
        if (!record.finished)
        {
            return JobState::InProgress;
        }
        return record.success ? JobState::Finished : JobState::Failed;
    }

    JobState derive_state(const std::optional<JobRecord> &record) noexcept
    {
        if (!record)
        {
            return JobState::NotStarted;
        }
        return derive_state(*record);
    }

    JobRecord decode_job_record(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            malformed("job status is not a JSON object");
        }

        JobRecord record;
        const auto &id = require(json, "id");
        if (!id.is_number_integer())
        {
            malformed("job status field 'id' is not an integer");
        }
        record.id = id.get<JobId>();

        const auto &start = require(json, "startTime");
        if (!start.is_string())
        {
            malformed("job status field 'startTime' is not a string");
        }
        record.start_time = parse_timestamp(start.get<std::string>());
        record.end_time = decode_end_time(require(json, "endTime"));

        const auto success = require_bool(json, "success");
        record.finished = require_bool(json, "finished");
        // An unfinished job cannot have succeeded yet.
        record.success = record.finished && success;

        if (const auto it = json.find("error"); it != json.end() && it->is_string())
        {
            record.error = it->get<std::string>();
        }
        if (const auto it = json.find("output"); it != json.end())
        {
            record.output = *it;
        }
        return record;
    }

    std::optional<TransferStats> decode_transfer_stats(const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            malformed("core/stats payload is not a JSON object");
        }
        const auto it = json.find("transferring");
        if (it == json.end() || it->is_null())
        {
            return std::nullopt;
        }
        if (!it->is_array())
        {
            malformed("core/stats field 'transferring' is not an array");
        }
        if (it->empty())
        {
            return std::nullopt;
        }

        const auto &entry = it->front();
        if (!entry.is_object())
        {
            malformed("transfer stats entry is not an object");
        }
        TransferStats stats;
        stats.transferred_bytes = byte_count(entry, "bytes");
        stats.total_bytes = byte_count(entry, "size");
        stats.speed = stats_field(entry, "speed").get<double>();
        stats.average_speed = stats_field(entry, "speedAvg").get<double>();
        const auto name = entry.find("name");
        if (name == entry.end() || !name->is_string())
        {
            malformed("transfer stats entry has no 'name'");
        }
        stats.name = name->get<std::string>();
        return stats;
    }

} // namespace rcctl::jobs
