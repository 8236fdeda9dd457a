#include "rcctl/client/job_registry.hpp"

#include <algorithm>
#include <string>

#include "rcctl/error_codes.hpp"

namespace rcctl::client
{

    bool JobRegistry::add(JobId id)
    {
        const auto [it, inserted] = entries_.try_emplace(id, std::nullopt);
        if (inserted)
        {
            order_.push_back(id);
        }
        return inserted;
    }

    bool JobRegistry::contains(JobId id) const
    {
        return entries_.find(id) != entries_.end();
    }

    std::optional<JobRegistry::JobRecord> JobRegistry::get(JobId id) const
    {
        const auto it = entries_.find(id);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool JobRegistry::store(JobId id, JobRecord record)
    {
        const auto it = entries_.find(id);
        if (it == entries_.end())
        {
            return false;
        }
        if (rcctl::jobs::is_terminal(rcctl::jobs::derive_state(it->second)))
        {
            return false;
        }
        it->second = std::move(record);
        return true;
    }

    bool JobRegistry::remove(JobId id)
    {
        if (entries_.erase(id) == 0)
        {
            return false;
        }
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        return true;
    }

    JobRegistry::JobState JobRegistry::state(JobId id) const
    {
        const auto it = entries_.find(id);
        if (it == entries_.end())
        {
            throw RcError(ErrorCode::JobUnknown, "job " + std::to_string(id) + " is not tracked");
        }
        return rcctl::jobs::derive_state(it->second);
    }

    std::vector<JobRegistry::JobId> JobRegistry::cleanup_terminal()
    {
        std::vector<JobId> removed;
        for (const auto id : order_)
        {
            if (rcctl::jobs::is_terminal(rcctl::jobs::derive_state(entries_.at(id))))
            {
                removed.push_back(id);
            }
        }
        for (const auto id : removed)
        {
            remove(id);
        }
        return removed;
    }

    std::vector<JobRegistry::JobRecord> JobRegistry::records() const
    {
        std::vector<JobRecord> result;
        result.reserve(order_.size());
        for (const auto id : order_)
        {
            const auto &record = entries_.at(id);
            if (record)
            {
                result.push_back(*record);
            }
        }
        return result;
    }

} // namespace rcctl::client
