#include "rcctl/client/cancellation.hpp"

#include <condition_variable>
#include <mutex>
#include <string>

#include "rcctl/error_codes.hpp"
#include "rcctl/protocol.hpp"

namespace rcctl::client
{

    using rcctl::jobs::JobId;
    using rcctl::protocol::Endpoint;

    bool interruptible_sleep(std::chrono::milliseconds duration, std::stop_token token)
    {
        if (duration.count() > 0)
        {
            std::mutex mutex;
            std::condition_variable_any cv;
            std::unique_lock lock(mutex);
            cv.wait_for(lock, token, duration, []
                        { return false; });
        }
        return !token.stop_requested();
    }

    CancellationController::CancellationController(Transport &transport, JobRegistry &registry, JobPoller &poller,
                                                   StopPolicy policy, Logger logger)
        : transport_(transport),
          registry_(registry),
          poller_(poller),
          policy_(policy),
          logger_(std::move(logger)) {}

    void CancellationController::stop_job(JobId id)
    {
        const auto response = transport_.request(Endpoint::JobStop, rcctl::protocol::JobIdRequest{id});
        if (!response.ok())
        {
            if (response.error == ErrorCode::TransientNetwork || response.error == ErrorCode::MalformedPayload)
            {
                expect_ok(response, Endpoint::JobStop);
            }
            throw RcError(ErrorCode::StopNotAcknowledged,
                          "job/stop for job " + std::to_string(id) + " was rejected: " + response.message);
        }
        if (!response.payload.is_object() || !response.payload.empty())
        {
            throw RcError(ErrorCode::StopNotAcknowledged,
                          "job/stop for job " + std::to_string(id) + " answered " + response.payload.dump());
        }
        logger_.log("stop", "stop requested for job ", id);
    }

    StopSummary CancellationController::stop_all_pending(std::stop_token token)
    {
        StopSummary summary;
        for (const auto &snapshot : poller_.refresh_all())
        {
            if (rcctl::jobs::is_terminal(snapshot.state))
            {
                continue;
            }
            if (token.stop_requested())
            {
                summary.cancelled = true;
                break;
            }

            try
            {
                stop_job(snapshot.id);
            }
            catch (const RcError &ex)
            {
                if (ex.code() != ErrorCode::StopNotAcknowledged)
                {
                    throw;
                }
                logger_.warn("stop", ex.what());
                summary.rejected.push_back(snapshot.id);
                continue;
            }
            summary.requested.push_back(snapshot.id);

            const auto outcome = await_finished(snapshot.id, token);
            if (outcome == WaitOutcome::Confirmed)
            {
                summary.confirmed.push_back(snapshot.id);
                continue;
            }
            summary.unconfirmed.push_back(snapshot.id);
            if (outcome == WaitOutcome::Cancelled)
            {
                summary.cancelled = true;
                break;
            }
            logger_.warn("stop", "job ", snapshot.id, " still not finished after ", policy_.max_attempts,
                         " status queries");
        }
        return summary;
    }

    CancellationController::WaitOutcome CancellationController::await_finished(JobId id, std::stop_token token)
    {
        for (std::size_t attempt = 0; policy_.max_attempts == 0 || attempt < policy_.max_attempts; ++attempt)
        {
            if (token.stop_requested())
            {
                return WaitOutcome::Cancelled;
            }

            const auto response = transport_.request(Endpoint::JobStatus, rcctl::protocol::JobIdRequest{id});
            if (response.ok())
            {
                auto record = rcctl::jobs::decode_job_record(response.payload);
                if (record.id != id)
                {
                    throw RcError(ErrorCode::MalformedPayload, "job/status for job " + std::to_string(id) +
                                                                   " answered for job " + std::to_string(record.id));
                }
                const bool finished = record.finished;
                registry_.store(id, std::move(record));
                if (finished)
                {
                    logger_.log("stop", "job ", id, " confirmed finished as ",
                                rcctl::jobs::to_string(registry_.state(id)));
                    return WaitOutcome::Confirmed;
                }
            }
            else if (response.error == ErrorCode::MalformedPayload)
            {
                expect_ok(response, Endpoint::JobStatus);
            }
            else
            {
                logger_.warn("stop", "status of job ", id, " unavailable (", rcctl::to_string(response.error),
                             "): ", response.message);
            }

            if (!interruptible_sleep(policy_.poll_interval, token))
            {
                return WaitOutcome::Cancelled;
            }
        }
        return WaitOutcome::Exhausted;
    }

} // namespace rcctl::client
