#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "rcctl/jobs.hpp"

namespace rcctl::client
{

    // Records without transfer stats are skipped by every function below.

    // sum(transferred) / sum(total). Throws RcError(DivisionUndefined) when the total is zero.
    double aggregate_percentage(std::span<const rcctl::jobs::JobRecord> snapshot);

    double aggregate_speed(std::span<const rcctl::jobs::JobRecord> snapshot);

    double aggregate_average_speed(std::span<const rcctl::jobs::JobRecord> snapshot);

    struct TransferSummary
    {
        std::size_t transfers{};
        std::uint64_t transferred_bytes{};
        std::uint64_t total_bytes{};
        std::optional<double> percentage;
        double speed{};
        double average_speed{};
    };

    TransferSummary summarize(std::span<const rcctl::jobs::JobRecord> snapshot);

} // namespace rcctl::client
