#include "range_planner.hpp"
#include <algorithm>

namespace parcp::core {

auto effective_workers(std::uint64_t size,
                       std::uint32_t requested,
                       std::uint64_t small_file_threshold) -> std::uint32_t
{
    if (size < small_file_threshold) {
        return 1;
    }
    return std::max<std::uint32_t>(requested, 1);
}

auto plan_ranges(std::uint64_t size, std::uint32_t workers) -> std::vector<ByteRange> {
    workers = std::max<std::uint32_t>(workers, 1);
    const std::uint64_t slice = size / workers;

    std::vector<ByteRange> ranges;
    ranges.reserve(workers);
    for (std::uint32_t i = 0; i + 1 < workers; ++i) {
        ranges.push_back(ByteRange{.start = i * slice, .end = (i + 1) * slice});
    }
    ranges.push_back(ByteRange{.start = (workers - 1) * slice, .end = size});
    return ranges;
}

} // namespace parcp::core
