#include <algorithm>

#include <fmt/format.h>

#include <parafetch/range_planner.hpp>

namespace parafetch
{
    namespace
    {
        std::uint64_t ceil_div(std::uint64_t a, std::uint64_t b)
        {
            return a / b + (a % b != 0 ? 1 : 0);
        }
    }

    std::string to_range_spec(const ByteRange& range)
    {
        return fmt::format("{}-{}", range.start, range.end);
    }

    RangePlan plan_ranges(std::uint64_t total_size,
                          std::int64_t min_chunk_size,
                          std::size_t max_workers,
                          bool supports_range)
    {
        RangePlan plan;

        if (total_size == 0)
        {
            // nothing to partition, a single plain request discovers the length
            return plan;
        }

        plan.ranged = supports_range;

        if (!supports_range || min_chunk_size <= 0
            || total_size < static_cast<std::uint64_t>(min_chunk_size))
        {
            plan.ranges.push_back(ByteRange{ 0, total_size - 1 });
            return plan;
        }

        std::uint64_t workers = ceil_div(total_size, static_cast<std::uint64_t>(min_chunk_size));
        workers = std::clamp<std::uint64_t>(
            workers, 1, std::max<std::uint64_t>(1, static_cast<std::uint64_t>(max_workers)));

        const std::uint64_t chunk = ceil_div(total_size, workers);
        for (std::uint64_t i = 0; i < workers; ++i)
        {
            const std::uint64_t start = i * chunk;
            if (start >= total_size)
            {
                // rounding the chunk up can leave trailing workers without bytes
                break;
            }
            const std::uint64_t end = std::min(start + chunk - 1, total_size - 1);
            plan.ranges.push_back(ByteRange{ start, end });
        }
        plan.ranges.back().end = total_size - 1;
        plan.worker_count = plan.ranges.size();
        return plan;
    }
}
