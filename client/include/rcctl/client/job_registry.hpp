#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

#include "rcctl/jobs.hpp"

namespace rcctl::client
{

    // Jobs this client is responsible for, in submission order, each with the
    // last record the daemon reported for it (none until the first poll lands).
    class JobRegistry
    {
    public:
        using JobId = rcctl::jobs::JobId;
        using JobRecord = rcctl::jobs::JobRecord;
        using JobState = rcctl::jobs::JobState;

        // Returns false when the id is already tracked.
        bool add(JobId id);

        bool contains(JobId id) const;

        std::optional<JobRecord> get(JobId id) const;

        // Replaces the stored record. A terminal record is never replaced; returns
        // false when the id is not tracked or the stored record is terminal.
        bool store(JobId id, JobRecord record);

        bool remove(JobId id);

        // Throws RcError(JobUnknown) for ids that are not tracked.
        JobState state(JobId id) const;

        // Drops every finished or failed job and returns their ids.
        std::vector<JobId> cleanup_terminal();

        std::vector<JobId> ids() const { return order_; }

        // Stored records in submission order; jobs without a record are skipped.
        std::vector<JobRecord> records() const;

        std::size_t size() const noexcept { return order_.size(); }
        bool empty() const noexcept { return order_.empty(); }

    private:
        std::vector<JobId> order_;
        std::unordered_map<JobId, std::optional<JobRecord>> entries_;
    };

} // namespace rcctl::client
