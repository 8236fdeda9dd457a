/**
 * rcctl - Remote-control endpoints and their request/response payloads.
 */
#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "rcctl/error_codes.hpp"

namespace rcctl::protocol
{

    using JobId = std::int64_t;

    enum class Endpoint : std::uint8_t
    {
        RcNoop,
        CoreQuit,
        CoreStats,
        CoreGroupList,
        CoreStatsDelete,
        JobStatus,
        JobList,
        JobStop,
        ConfigDump,
        OperationsList,
        OperationsStat,
        OperationsCopyFile,
        OperationsDeleteFile,
        OperationsHashsum
    };

    std::string_view to_string(Endpoint endpoint) noexcept;
    std::optional<Endpoint> endpoint_from_string(std::string_view value) noexcept;

    // Stats group the daemon files a job's transfers under.
    std::string job_stats_group(JobId id);

    struct JobIdRequest
    {
        JobId jobid{};
    };

    void to_json(nlohmann::json &json, const JobIdRequest &request);
    void from_json(const nlohmann::json &json, JobIdRequest &request);

    struct StatsGroupRequest
    {
        std::string group;
    };

    void to_json(nlohmann::json &json, const StatsGroupRequest &request);
    void from_json(const nlohmann::json &json, StatsGroupRequest &request);

    struct JobListResponse
    {
        std::vector<JobId> jobids;
    };

    void from_json(const nlohmann::json &json, JobListResponse &response);

    struct GroupListResponse
    {
        std::vector<std::string> groups;
    };

    void from_json(const nlohmann::json &json, GroupListResponse &response);

    struct AsyncJobResponse
    {
        JobId jobid{};
    };

    void from_json(const nlohmann::json &json, AsyncJobResponse &response);

    struct PathRequest
    {
        std::string fs;
        std::string remote;
    };

    void to_json(nlohmann::json &json, const PathRequest &request);
    void from_json(const nlohmann::json &json, PathRequest &request);

    struct CopyFileRequest
    {
        std::string src_fs;
        std::string src_remote;
        std::string dst_fs;
        std::string dst_remote;
        bool async{true};
    };

    void to_json(nlohmann::json &json, const CopyFileRequest &request);

    struct DeleteFileRequest
    {
        std::string fs;
        std::string remote;
        bool async{true};
    };

    void to_json(nlohmann::json &json, const DeleteFileRequest &request);

    struct HashsumRequest
    {
        std::string fs;
        std::string hash_type;
    };

    void to_json(nlohmann::json &json, const HashsumRequest &request);

    struct RemoteEntry
    {
        std::string type;
        std::string name;
    };

    // config/dump maps remote names to their settings; names come back with a trailing ':'.
    std::vector<RemoteEntry> remotes_from_config_dump(const nlohmann::json &dump);

    // Body the daemon sends with any non-2xx status.
    struct DaemonErrorBody
    {
        std::string error;
        int status{};
        std::string path;
    };

    void from_json(const nlohmann::json &json, DaemonErrorBody &body);

    template <typename T>
    T decode_payload(const nlohmann::json &json, std::string_view what)
    {
        try
        {
            return json.get<T>();
        }
        catch (const std::exception &ex)
        {
            throw RcError(ErrorCode::MalformedPayload, std::string(what) + ": " + ex.what());
        }
    }

} // namespace rcctl::protocol
