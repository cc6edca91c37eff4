#include "range_splitter.hpp"
#include "exception.hpp"
#include "localization.hpp"

std::vector<IndexRange> split_indices(std::size_t total, std::size_t workers) {
    if (workers == 0) {
        throw SlpkException(get_string("error.zero_workers"));
    }

    const std::size_t base = total / workers;
    const std::size_t remainder = total % workers;

    std::vector<IndexRange> ranges;
    ranges.reserve(workers);

    std::size_t start = 0;
    for (std::size_t i = 0; i < workers; ++i) {
        std::size_t length = base + (i < remainder ? 1 : 0);
        ranges.push_back({start, start + length});
        start += length;
    }
    return ranges;
}
