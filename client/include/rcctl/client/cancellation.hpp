#pragma once

#include <chrono>
#include <cstddef>
#include <stop_token>
#include <vector>

#include "rcctl/client/job_poller.hpp"
#include "rcctl/client/job_registry.hpp"
#include "rcctl/client/logger.hpp"
#include "rcctl/client/transport.hpp"
#include "rcctl/jobs.hpp"

namespace rcctl::client
{

    struct StopPolicy
    {
        std::chrono::milliseconds poll_interval{500};
        // Status queries per job before giving up on a confirmation; 0 waits forever.
        std::size_t max_attempts{120};
    };

    struct StopSummary
    {
        std::vector<rcctl::jobs::JobId> requested;
        std::vector<rcctl::jobs::JobId> confirmed;
        std::vector<rcctl::jobs::JobId> unconfirmed;
        // Jobs whose stop the daemon refused; the remaining jobs are still stopped.
        std::vector<rcctl::jobs::JobId> rejected;
        bool cancelled{false};
    };

    // Sleeps unless the token is stopped first. Returns false when stopped.
    bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token token);

    class CancellationController
    {
    public:
        CancellationController(Transport &transport, JobRegistry &registry, JobPoller &poller, StopPolicy policy,
                               Logger logger);

        // Throws RcError(StopNotAcknowledged) unless the daemon answers with an empty object.
        void stop_job(rcctl::jobs::JobId id);

        // Stops every pending or running job, one at a time, waiting for the daemon
        // to report each one finished before moving on. A refused stop is recorded in
        // StopSummary::rejected; network and payload failures still throw.
        StopSummary stop_all_pending(std::stop_token token = {});

    private:
        enum class WaitOutcome
        {
            Confirmed,
            Cancelled,
            Exhausted
        };

        WaitOutcome await_finished(rcctl::jobs::JobId id, std::stop_token token);

        Transport &transport_;
        JobRegistry &registry_;
        JobPoller &poller_;
        StopPolicy policy_;
        Logger logger_;
    };

} // namespace rcctl::client
