#pragma once

#include "config.hpp"
#include "exception.hpp"
#include "range_splitter.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

// What one worker achieved over its range. A failing worker abandons the
// rest of its range, so entries_unpacked counts the entries before the error.
struct WorkerReport {
    IndexRange range;
    std::size_t entries_unpacked = 0;
    std::optional<UnpackException> error;
};

// Unpacks the entries in range with a private archive handle.
// Entry errors end up in the report; anything else escapes.
WorkerReport unpack_range(const std::filesystem::path& package_path, const std::filesystem::path& unpack_folder, IndexRange range, bool verbose);

using RangeWorker = std::function<WorkerReport(IndexRange)>;

// Runs worker on every non-empty range in parallel and joins all of them.
// Returns the summed entries_unpacked, or throws PartialUnpackException built
// from the first failing range (total_entries is reported alongside).
// Anything other than a report escaping a worker is WorkerAbortedException.
std::size_t run_workers(const std::vector<IndexRange>& ranges, std::size_t total_entries, const RangeWorker& worker);

// Unpacks a package into a folder next to it, named after the package without
// its extension, using options.workers parallel workers. Returns the number of
// entries unpacked.
//
// Setup failures (unreadable package, unusable output folder) throw
// UnpackException before any worker starts. If a worker fails, the remaining
// workers still run to completion and PartialUnpackException is thrown
// afterwards with the first failure. WorkerAbortedException means a worker
// died abnormally.
std::size_t unpack_package(const std::filesystem::path& package_path, const UnpackOptions& options);
