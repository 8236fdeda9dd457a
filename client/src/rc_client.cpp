#include "rcctl/client/rc_client.hpp"

#include "rcctl/client/http_transport.hpp"
#include "rcctl/error_codes.hpp"

namespace rcctl::client
{

    using rcctl::jobs::JobId;
    using rcctl::protocol::Endpoint;

    namespace
    {

        StopPolicy stop_policy_from(const ClientConfig &config)
        {
            return StopPolicy{
                .poll_interval = config.stop_poll_interval,
                .max_attempts = config.stop_max_attempts,
            };
        }

        std::string join_path(const std::string &root, const std::string &path)
        {
            if (root.empty() || root.back() == ':' || root.back() == '/')
            {
                return root + path;
            }
            return root + "/" + path;
        }

    } // namespace

    RcClient::RcClient(ClientConfig config, Logger logger)
        : RcClient(config, logger,
                   std::make_unique<HttpTransport>(config.host, config.port, config.credentials,
                                                   config.request_timeout, logger))
    {
    }

    RcClient::RcClient(ClientConfig config, Logger logger, std::unique_ptr<Transport> transport)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          transport_(std::move(transport)),
          poller_(*transport_, registry_, logger_),
          cancellation_(*transport_, registry_, poller_, stop_policy_from(config_), logger_)
    {
    }

    RcClient::~RcClient() = default;

    void RcClient::run_daemon(std::size_t attempts, std::chrono::milliseconds interval)
    {
        if (owns_daemon())
        {
            throw RcError(ErrorCode::ProcessError, "daemon already running");
        }
        daemon_ = std::make_unique<DaemonProcess>(
            DaemonOptions{
                .command = config_.rclone_command,
                .address = config_.host,
                .port = config_.port,
                .credentials = config_.credentials,
            },
            logger_);
        daemon_->start();

        for (std::size_t attempt = 0; attempt < attempts; ++attempt)
        {
            if (is_ready())
            {
                logger_.log("daemon", "ready after ", attempt + 1, " probe(s)");
                return;
            }
            interruptible_sleep(interval, {});
        }
        daemon_->terminate();
        throw RcError(ErrorCode::ProcessError, "daemon did not start listening on " + config_.host + ":" +
                                                   std::to_string(config_.port));
    }

    bool RcClient::is_ready()
    {
        // Only a connection-level failure means nothing is listening yet.
        return transport_->request(Endpoint::RcNoop).error != ErrorCode::TransientNetwork;
    }

    void RcClient::quit()
    {
        const auto response = transport_->request(Endpoint::CoreQuit);
        if (!owns_daemon())
        {
            expect_ok(response, Endpoint::CoreQuit);
            return;
        }
        if (!response.ok())
        {
            logger_.warn("daemon", "core/quit failed (", rcctl::to_string(response.error), "): ", response.message);
        }
        daemon_->terminate();
    }

    void RcClient::kill()
    {
        if (!daemon_)
        {
            throw RcError(ErrorCode::ProcessError, "unable to kill a daemon that was not started by this client");
        }
        daemon_->kill();
    }

    std::vector<rcctl::protocol::RemoteEntry> RcClient::list_remotes()
    {
        return rcctl::protocol::remotes_from_config_dump(call(Endpoint::ConfigDump));
    }

    nlohmann::json RcClient::ls(const std::string &root, const std::string &path)
    {
        try
        {
            const auto payload = call(Endpoint::OperationsList, rcctl::protocol::PathRequest{root, path});
            if (!payload.contains("list") || !payload.at("list").is_array())
            {
                throw RcError(ErrorCode::MalformedPayload, "operations/list returned no list");
            }
            return payload.at("list");
        }
        catch (const RcError &ex)
        {
            if (ex.code() == ErrorCode::NotFound)
            {
                throw RcError(ErrorCode::NotFound, join_path(root, path) + " was not found");
            }
            throw;
        }
    }

    nlohmann::json RcClient::stat(const std::string &root, const std::string &path)
    {
        const auto payload = call(Endpoint::OperationsStat, rcctl::protocol::PathRequest{root, path});
        const auto it = payload.find("item");
        if (it == payload.end() || it->is_null())
        {
            throw RcError(ErrorCode::NotFound, join_path(root, path) + " was not found");
        }
        return *it;
    }

    nlohmann::json RcClient::checksum(const std::string &root, const std::string &hash_type)
    {
        const auto payload = call(Endpoint::OperationsHashsum, rcctl::protocol::HashsumRequest{root, hash_type});
        const auto it = payload.find("hashsum");
        if (it == payload.end() || !it->is_array())
        {
            throw RcError(ErrorCode::MalformedPayload, "operations/hashsum returned no hashsum list");
        }
        return *it;
    }

    JobId RcClient::copy_file(const std::string &src_root, const std::string &src_path, const std::string &dst_root,
                              const std::string &dst_path)
    {
        const rcctl::protocol::CopyFileRequest request{
            .src_fs = src_root,
            .src_remote = src_path,
            .dst_fs = dst_root,
            .dst_remote = dst_path,
        };
        return submit(Endpoint::OperationsCopyFile, request);
    }

    JobId RcClient::delete_file(const std::string &root, const std::string &path)
    {
        const rcctl::protocol::DeleteFileRequest request{
            .fs = root,
            .remote = path,
        };
        return submit(Endpoint::OperationsDeleteFile, request);
    }

    bool RcClient::track(JobId id)
    {
        if (id <= 0)
        {
            throw RcError(ErrorCode::InvalidArgument, "job ids are positive, got " + std::to_string(id));
        }
        return registry_.add(id);
    }

    rcctl::jobs::JobRecord RcClient::job_status(JobId id)
    {
        return poller_.fetch_status(id);
    }

    std::vector<JobSnapshot> RcClient::refresh_jobs()
    {
        return poller_.refresh_all();
    }

    bool RcClient::all_terminal()
    {
        return poller_.all_terminal();
    }

    TransferSummary RcClient::transfer_summary() const
    {
        const auto records = registry_.records();
        return summarize(records);
    }

    void RcClient::stop_job(JobId id)
    {
        cancellation_.stop_job(id);
    }

    StopSummary RcClient::stop_all_pending(std::stop_token token)
    {
        return cancellation_.stop_all_pending(std::move(token));
    }

    std::vector<JobId> RcClient::cleanup_terminal()
    {
        const auto removed = registry_.cleanup_terminal();
        for (const auto id : removed)
        {
            const auto response = transport_->request(
                Endpoint::CoreStatsDelete, rcctl::protocol::StatsGroupRequest{rcctl::protocol::job_stats_group(id)});
            if (!response.ok())
            {
                logger_.warn("cleanup", "core/stats-delete for job ", id, " failed (", rcctl::to_string(response.error),
                             "): ", response.message);
            }
        }
        logger_.log("cleanup", "removed ", removed.size(), " terminal job(s)");
        return removed;
    }

    std::vector<std::string> RcClient::stats_groups()
    {
        return rcctl::protocol::decode_payload<rcctl::protocol::GroupListResponse>(call(Endpoint::CoreGroupList),
                                                                                   "core/group-list")
            .groups;
    }

    JobId RcClient::submit(Endpoint endpoint, const nlohmann::json &request)
    {
        const auto response =
            rcctl::protocol::decode_payload<rcctl::protocol::AsyncJobResponse>(call(endpoint, request),
                                                                              rcctl::protocol::to_string(endpoint));
        if (response.jobid <= 0)
        {
            throw RcError(ErrorCode::MalformedPayload, std::string(rcctl::protocol::to_string(endpoint)) +
                                                           " returned job id " + std::to_string(response.jobid));
        }
        registry_.add(response.jobid);
        logger_.log("submit", rcctl::protocol::to_string(endpoint), " -> job ", response.jobid);
        return response.jobid;
    }

    nlohmann::json RcClient::call(Endpoint endpoint, const nlohmann::json &params)
    {
        return expect_ok(transport_->request(endpoint, params), endpoint);
    }

} // namespace rcctl::client
