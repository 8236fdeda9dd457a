#pragma once

#include <functional>
#include <optional>
#include <unordered_set>
#include <vector>

#include "rcctl/client/job_registry.hpp"
#include "rcctl/client/logger.hpp"
#include "rcctl/client/transport.hpp"
#include "rcctl/jobs.hpp"

namespace rcctl::client
{

    struct JobSnapshot
    {
        rcctl::jobs::JobId id{};
        rcctl::jobs::JobState state{rcctl::jobs::JobState::NotStarted};
    };

    // Reconciles the registry against the daemon. One pass fetches job/list once,
    // then queries status and stats for every tracked job the daemon still knows.
    class JobPoller
    {
    public:
        using Visitor = std::function<void(rcctl::jobs::JobId, rcctl::jobs::JobState)>;

        JobPoller(Transport &transport, JobRegistry &registry, Logger logger);

        // Visits every tracked job in submission order as soon as its state is known.
        void refresh_each(const Visitor &visitor);

        std::vector<JobSnapshot> refresh_all();

        // One full pass; true when no tracked job is still pending or running.
        bool all_terminal();

        // One-shot status and stats query; every failure propagates as RcError.
        rcctl::jobs::JobRecord fetch_status(rcctl::jobs::JobId id);

    private:
        std::optional<std::unordered_set<rcctl::jobs::JobId>> fetch_live_ids();
        std::optional<rcctl::jobs::JobRecord> poll_job(rcctl::jobs::JobId id);
        bool usable(const Response &response, rcctl::protocol::Endpoint endpoint, rcctl::jobs::JobId id);

        Transport &transport_;
        JobRegistry &registry_;
        Logger logger_;
    };

} // namespace rcctl::client
