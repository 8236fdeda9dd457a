#include "rcctl/client/job_poller.hpp"

#include "rcctl/error_codes.hpp"
#include "rcctl/protocol.hpp"

namespace rcctl::client
{

    using rcctl::jobs::JobId;
    using rcctl::jobs::JobRecord;
    using rcctl::jobs::JobState;
    using rcctl::protocol::Endpoint;

    JobPoller::JobPoller(Transport &transport, JobRegistry &registry, Logger logger)
        : transport_(transport),
          registry_(registry),
          logger_(std::move(logger)) {}

    void JobPoller::refresh_each(const Visitor &visitor)
    {
        const auto ids = registry_.ids();
        const auto live = fetch_live_ids();
        for (const auto id : ids)
        {
            if (live && live->count(id) != 0)
            {
                if (auto record = poll_job(id))
                {
                    if (!registry_.store(id, std::move(*record)))
                    {
                        logger_.log("poll", "job ", id, " already terminal, ignoring update");
                    }
                }
            }
            else if (live)
            {
                logger_.log("poll", "job ", id, " no longer listed by daemon, keeping last record");
            }
            visitor(id, registry_.state(id));
        }
    }

    std::vector<JobSnapshot> JobPoller::refresh_all()
    {
        std::vector<JobSnapshot> snapshots;
        snapshots.reserve(registry_.size());
        refresh_each([&snapshots](JobId id, JobState state)
                     { snapshots.push_back(JobSnapshot{id, state}); });
        return snapshots;
    }

    bool JobPoller::all_terminal()
    {
        bool terminal = true;
        refresh_each([&terminal](JobId, JobState state)
                     {
                         if (!rcctl::jobs::is_terminal(state))
                         {
                             terminal = false;
                         } });
        return terminal;
    }

    JobRecord JobPoller::fetch_status(JobId id)
    {
        const auto status = transport_.request(Endpoint::JobStatus, rcctl::protocol::JobIdRequest{id});
        auto record = rcctl::jobs::decode_job_record(expect_ok(status, Endpoint::JobStatus));

        const auto stats = transport_.request(Endpoint::CoreStats,
                                              rcctl::protocol::StatsGroupRequest{rcctl::protocol::job_stats_group(id)});
        record.stats = rcctl::jobs::decode_transfer_stats(expect_ok(stats, Endpoint::CoreStats));
        return record;
    }

    std::optional<std::unordered_set<JobId>> JobPoller::fetch_live_ids()
    {
        const auto response = transport_.request(Endpoint::JobList);
        if (!response.ok())
        {
            if (response.error == ErrorCode::MalformedPayload)
            {
                expect_ok(response, Endpoint::JobList);
            }
            logger_.warn("poll", "job/list failed (", rcctl::to_string(response.error), "): ", response.message,
                         "; keeping last known records");
            return std::nullopt;
        }
        const auto list = rcctl::protocol::decode_payload<rcctl::protocol::JobListResponse>(response.payload, "job/list");
        return std::unordered_set<JobId>(list.jobids.begin(), list.jobids.end());
    }

    std::optional<JobRecord> JobPoller::poll_job(JobId id)
    {
        const auto status = transport_.request(Endpoint::JobStatus, rcctl::protocol::JobIdRequest{id});
        if (!usable(status, Endpoint::JobStatus, id))
        {
            return std::nullopt;
        }
        auto record = rcctl::jobs::decode_job_record(status.payload);
        if (record.id != id)
        {
            throw RcError(ErrorCode::MalformedPayload, "job/status for " + std::to_string(id) + " answered for job " +
                                                           std::to_string(record.id));
        }

        const auto stats = transport_.request(Endpoint::CoreStats,
                                              rcctl::protocol::StatsGroupRequest{rcctl::protocol::job_stats_group(id)});
        if (!usable(stats, Endpoint::CoreStats, id))
        {
            return std::nullopt;
        }
        record.stats = rcctl::jobs::decode_transfer_stats(stats.payload);
        return record;
    }

    // True for a usable response. Protocol mismatches propagate; anything else is
    // logged and the previous record stays in place.
    bool JobPoller::usable(const Response &response, Endpoint endpoint, JobId id)
    {
        if (response.ok())
        {
            return true;
        }
        if (response.error == ErrorCode::MalformedPayload)
        {
            expect_ok(response, endpoint);
        }
        logger_.warn("poll", rcctl::protocol::to_string(endpoint), " for job ", id, " failed (",
                     rcctl::to_string(response.error), "): ", response.message, "; keeping last record");
        return false;
    }

} // namespace rcctl::client
