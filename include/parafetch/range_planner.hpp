#ifndef PARAFETCH_RANGE_PLANNER_HPP
#define PARAFETCH_RANGE_PLANNER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <parafetch/export.hpp>

namespace parafetch
{
    // Inclusive byte span `[start, end]`.
    struct ByteRange
    {
        std::uint64_t start = 0;
        std::uint64_t end = 0;

        std::uint64_t size() const noexcept
        {
            return end - start + 1;
        }

        bool operator==(const ByteRange& other) const noexcept
        {
            return start == other.start && end == other.end;
        }

        bool operator!=(const ByteRange& other) const noexcept
        {
            return !(*this == other);
        }
    };

    // Value for CURLOPT_RANGE / the `Range: bytes=` header, e.g. "0-499999".
    PARAFETCH_API std::string to_range_spec(const ByteRange& range);

    struct RangePlan
    {
        std::size_t worker_count = 1;
        // Ascending, disjoint and contiguous, covering exactly [0, total_size - 1].
        // Empty when the size is unknown.
        std::vector<ByteRange> ranges;
        // True when workers must request their range; false means one worker
        // streams the whole resource with a plain request.
        bool ranged = false;
    };

    // Decides how many workers fetch the resource and which span each one owns.
    //
    // A single worker covers the whole resource when the server does not
    // support ranges, when the resource is smaller than `min_chunk_size` or when
    // `min_chunk_size` is not positive. Otherwise the worker count is
    // ceil(total_size / min_chunk_size) clamped to [1, max_workers]; each range
    // spans ceil(total_size / workers) bytes and the last one ends at
    // total_size - 1.
    PARAFETCH_API RangePlan plan_ranges(std::uint64_t total_size,
                                        std::int64_t min_chunk_size,
                                        std::size_t max_workers,
                                        bool supports_range);
}

#endif
