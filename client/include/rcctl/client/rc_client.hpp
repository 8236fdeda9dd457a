#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rcctl/client/cancellation.hpp"
#include "rcctl/client/config.hpp"
#include "rcctl/client/daemon.hpp"
#include "rcctl/client/job_poller.hpp"
#include "rcctl/client/job_registry.hpp"
#include "rcctl/client/logger.hpp"
#include "rcctl/client/transfer_aggregator.hpp"
#include "rcctl/client/transport.hpp"
#include "rcctl/jobs.hpp"
#include "rcctl/protocol.hpp"

namespace rcctl::client
{

    // Client of one remote-control daemon: tracks the jobs it submitted and
    // optionally owns the daemon process itself.
    class RcClient
    {
    public:
        RcClient(ClientConfig config, Logger logger);
        RcClient(ClientConfig config, Logger logger, std::unique_ptr<Transport> transport);
        ~RcClient();

        RcClient(const RcClient &) = delete;
        RcClient &operator=(const RcClient &) = delete;

        // Launches "rclone rcd" and waits until it answers rc/noop.
        void run_daemon(std::size_t attempts = 50, std::chrono::milliseconds interval = std::chrono::milliseconds{100});
        bool is_ready();
        bool owns_daemon() const noexcept { return daemon_ && daemon_->running(); }

        // Asks the daemon to exit, then reaps it when this client launched it.
        void quit();
        void kill();

        std::vector<rcctl::protocol::RemoteEntry> list_remotes();
        nlohmann::json ls(const std::string &root, const std::string &path);
        nlohmann::json stat(const std::string &root, const std::string &path);
        nlohmann::json checksum(const std::string &root, const std::string &hash_type);

        rcctl::jobs::JobId copy_file(const std::string &src_root, const std::string &src_path,
                                     const std::string &dst_root, const std::string &dst_path);
        rcctl::jobs::JobId delete_file(const std::string &root, const std::string &path);
        // Starts tracking a job submitted elsewhere.
        bool track(rcctl::jobs::JobId id);

        rcctl::jobs::JobRecord job_status(rcctl::jobs::JobId id);
        std::vector<JobSnapshot> refresh_jobs();
        bool all_terminal();
        TransferSummary transfer_summary() const;

        void stop_job(rcctl::jobs::JobId id);
        StopSummary stop_all_pending(std::stop_token token = {});

        // Forgets finished and failed jobs and deletes their stats groups on the daemon.
        std::vector<rcctl::jobs::JobId> cleanup_terminal();
        std::vector<std::string> stats_groups();

        const JobRegistry &registry() const noexcept { return registry_; }
        const ClientConfig &config() const noexcept { return config_; }

    private:
        rcctl::jobs::JobId submit(rcctl::protocol::Endpoint endpoint, const nlohmann::json &request);
        nlohmann::json call(rcctl::protocol::Endpoint endpoint, const nlohmann::json &params = nlohmann::json::object());

        ClientConfig config_;
        Logger logger_;
        std::unique_ptr<Transport> transport_;
        std::unique_ptr<DaemonProcess> daemon_;
        JobRegistry registry_;
        JobPoller poller_;
        CancellationController cancellation_;
    };

} // namespace rcctl::client
