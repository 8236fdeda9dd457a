#include "rcctl/client/transfer_aggregator.hpp"

#include <utility>

#include "rcctl/error_codes.hpp"

namespace rcctl::client
{

    namespace
    {

        template <typename Accessor>
        auto sum_stats(std::span<const rcctl::jobs::JobRecord> snapshot, Accessor accessor)
        {
            decltype(accessor(std::declval<const rcctl::jobs::TransferStats &>())) total{};
            for (const auto &record : snapshot)
            {
                if (record.stats)
                {
                    total += accessor(*record.stats);
                }
            }
            return total;
        }

    } // namespace

    double aggregate_percentage(std::span<const rcctl::jobs::JobRecord> snapshot)
    {
        const auto transferred = sum_stats(snapshot, [](const auto &stats)
                                           { return stats.transferred_bytes; });
        const auto total = sum_stats(snapshot, [](const auto &stats)
                                     { return stats.total_bytes; });
        if (total == 0)
        {
            throw RcError(ErrorCode::DivisionUndefined, "no transfer with a known size in snapshot");
        }
        return static_cast<double>(transferred) / static_cast<double>(total);
    }

    double aggregate_speed(std::span<const rcctl::jobs::JobRecord> snapshot)
    {
        return sum_stats(snapshot, [](const auto &stats)
                         { return stats.speed; });
    }

    double aggregate_average_speed(std::span<const rcctl::jobs::JobRecord> snapshot)
    {
        return sum_stats(snapshot, [](const auto &stats)
                         { return stats.average_speed; });
    }

    TransferSummary summarize(std::span<const rcctl::jobs::JobRecord> snapshot)
    {
        TransferSummary summary;
        for (const auto &record : snapshot)
        {
            if (!record.stats)
            {
                continue;
            }
            ++summary.transfers;
            summary.transferred_bytes += record.stats->transferred_bytes;
            summary.total_bytes += record.stats->total_bytes;
        }
        if (summary.total_bytes != 0)
        {
            summary.percentage = aggregate_percentage(snapshot);
        }
        summary.speed = aggregate_speed(snapshot);
        summary.average_speed = aggregate_average_speed(snapshot);
        return summary;
    }

} // namespace rcctl::client
