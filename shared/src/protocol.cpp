#include "rcctl/protocol.hpp"

#include <array>
#include <charconv>
#include <stdexcept>

namespace rcctl::protocol
{

    namespace
    {

        struct EndpointMapping
        {
            Endpoint endpoint;
            std::string_view path;
        };

        constexpr std::array<EndpointMapping, 14> kEndpointMappings{{
            {Endpoint::RcNoop, "rc/noop"},
            {Endpoint::CoreQuit, "core/quit"},
            {Endpoint::CoreStats, "core/stats"},
            {Endpoint::CoreGroupList, "core/group-list"},
            {Endpoint::CoreStatsDelete, "core/stats-delete"},
            {Endpoint::JobStatus, "job/status"},
            {Endpoint::JobList, "job/list"},
            {Endpoint::JobStop, "job/stop"},
            {Endpoint::ConfigDump, "config/dump"},
            {Endpoint::OperationsList, "operations/list"},
            {Endpoint::OperationsStat, "operations/stat"},
            {Endpoint::OperationsCopyFile, "operations/copyfile"},
            {Endpoint::OperationsDeleteFile, "operations/deletefile"},
            {Endpoint::OperationsHashsum, "operations/hashsum"},
        }};

        JobId job_id_from_json(const nlohmann::json &value)
        {
            if (value.is_number_integer())
            {
                return value.get<JobId>();
            }
            if (value.is_string())
            {
                const auto text = value.get<std::string>();
                JobId id{};
                const auto *end = text.data() + text.size();
                const auto [ptr, ec] = std::from_chars(text.data(), end, id);
                if (ec == std::errc{} && ptr == end)
                {
                    return id;
                }
            }
            throw std::invalid_argument("job id is neither an integer nor a decimal string: " + value.dump());
        }

    } // namespace

    std::string_view to_string(Endpoint endpoint) noexcept
    {
        for (const auto &mapping : kEndpointMappings)
        {
            if (mapping.endpoint == endpoint)
            {
                return mapping.path;
            }
        }
        return "unknown";
    }

    std::optional<Endpoint> endpoint_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kEndpointMappings)
        {
            if (mapping.path == value)
            {
                return mapping.endpoint;
            }
        }
        return std::nullopt;
    }

    std::string job_stats_group(JobId id)
    {
        return "job/" + std::to_string(id);
    }

    void to_json(nlohmann::json &json, const JobIdRequest &request)
    {
        json = {{"jobid", request.jobid}};
    }

    void from_json(const nlohmann::json &json, JobIdRequest &request)
    {
        request.jobid = job_id_from_json(json.at("jobid"));
    }

    void to_json(nlohmann::json &json, const StatsGroupRequest &request)
    {
        json = {{"group", request.group}};
    }

    void from_json(const nlohmann::json &json, StatsGroupRequest &request)
    {
        json.at("group").get_to(request.group);
    }

    void from_json(const nlohmann::json &json, JobListResponse &response)
    {
        response.jobids.clear();
        const auto &ids = json.at("jobids");
        if (ids.is_null())
        {
            return;
        }
        if (!ids.is_array())
        {
            throw std::invalid_argument("jobids is not an array");
        }
        for (const auto &id : ids)
        {
            response.jobids.push_back(job_id_from_json(id));
        }
    }

    void from_json(const nlohmann::json &json, GroupListResponse &response)
    {
        response.groups.clear();
        const auto &groups = json.at("groups");
        if (groups.is_null())
        {
            return;
        }
        groups.get_to(response.groups);
    }

    void from_json(const nlohmann::json &json, AsyncJobResponse &response)
    {
        response.jobid = job_id_from_json(json.at("jobid"));
    }

    void to_json(nlohmann::json &json, const PathRequest &request)
    {
        json = {
            {"fs", request.fs},
            {"remote", request.remote},
        };
    }

    void from_json(const nlohmann::json &json, PathRequest &request)
    {
        json.at("fs").get_to(request.fs);
        json.at("remote").get_to(request.remote);
    }

    void to_json(nlohmann::json &json, const CopyFileRequest &request)
    {
        json = {
            {"srcFs", request.src_fs},
            {"srcRemote", request.src_remote},
            {"dstFs", request.dst_fs},
            {"dstRemote", request.dst_remote},
        };
        if (request.async)
        {
            json["_async"] = true;
        }
    }

    void to_json(nlohmann::json &json, const DeleteFileRequest &request)
    {
        json = {
            {"fs", request.fs},
            {"remote", request.remote},
        };
        if (request.async)
        {
            json["_async"] = true;
        }
    }

    void to_json(nlohmann::json &json, const HashsumRequest &request)
    {
        json = {
            {"fs", request.fs},
            {"hashType", request.hash_type},
        };
    }

    std::vector<RemoteEntry> remotes_from_config_dump(const nlohmann::json &dump)
    {
        std::vector<RemoteEntry> remotes;
        if (dump.is_null())
        {
            return remotes;
        }
        if (!dump.is_object())
        {
            throw RcError(ErrorCode::MalformedPayload, "config/dump did not return an object");
        }
        for (const auto &[name, settings] : dump.items())
        {
            RemoteEntry entry;
            entry.name = name + ":";
            if (settings.is_object())
            {
                entry.type = settings.value("type", std::string{});
            }
            remotes.push_back(std::move(entry));
        }
        return remotes;
    }

    void from_json(const nlohmann::json &json, DaemonErrorBody &body)
    {
        body.error = json.value("error", std::string{});
        body.status = json.value("status", 0);
        body.path = json.value("path", std::string{});
    }

} // namespace rcctl::protocol
