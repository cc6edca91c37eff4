#pragma once

#include <cstddef>
#include <vector>

// Half-open interval [start, end) of entry indices.
struct IndexRange {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t size() const { return end - start; }
    bool empty() const { return start == end; }

    bool operator==(const IndexRange&) const = default;
};

// Splits [0, total) into exactly `workers` contiguous ranges whose sizes differ
// by at most one. The larger ranges come first. Throws SlpkException if workers is 0.
std::vector<IndexRange> split_indices(std::size_t total, std::size_t workers);
