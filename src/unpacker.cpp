#include "unpacker.hpp"
#include "archive.hpp"
#include "entry_processor.hpp"
#include "localization.hpp"
#include "output_folder.hpp"
#include "utils.hpp"

#include <future>
#include <vector>

namespace fs = std::filesystem;

WorkerReport unpack_range(const fs::path& package_path, const fs::path& unpack_folder, IndexRange range, bool verbose) {
    WorkerReport report;
    report.range = range;

    try {
        PackageArchive archive(package_path);
        for (std::size_t entry_idx = range.start; entry_idx < range.end; ++entry_idx) {
            ArchiveEntry entry = archive.entry_at(entry_idx);
            unpack_entry(entry, unpack_folder, verbose);
            ++report.entries_unpacked;
        }
    } catch (const UnpackException& e) {
        report.error = e;
    }
    return report;
}

std::size_t run_workers(const std::vector<IndexRange>& ranges, std::size_t total_entries, const RangeWorker& worker) {
    std::vector<std::future<WorkerReport>> workers;
    workers.reserve(ranges.size());
    for (const IndexRange& range : ranges) {
        if (range.empty()) continue;
        workers.push_back(std::async(std::launch::async, worker, range));
    }

    // Join every worker, even after a failure, so nothing keeps writing
    // into the folder once we return.
    std::size_t total_entries_unpacked = 0;
    std::optional<UnpackException> first_error;
    for (auto& future : workers) {
        WorkerReport report;
        try {
            report = future.get();
        } catch (const std::exception& e) {
            throw WorkerAbortedException(string_format("error.worker_aborted", e.what()));
        } catch (...) {
            throw WorkerAbortedException(get_string("error.worker_aborted_unknown"));
        }

        total_entries_unpacked += report.entries_unpacked;
        if (report.error) {
            log_error(string_format("error.worker_failed", report.range.start, report.range.end, report.error->what()));
            if (!first_error) {
                first_error = report.error;
            }
        }
    }

    if (first_error) {
        throw PartialUnpackException(first_error->code(), first_error->what(), total_entries_unpacked, total_entries);
    }
    return total_entries_unpacked;
}

std::size_t unpack_package(const fs::path& package_path, const UnpackOptions& options) {
    log_info(string_format("info.unpacking_archive", package_path.string()));

    std::size_t num_entries = 0;
    {
        PackageArchive archive(package_path);
        num_entries = archive.entry_count();
    }
    fs::path unpack_folder = prepare_unpack_folder(package_path);

    std::vector<IndexRange> splits = split_indices(num_entries, options.workers);
    std::size_t total_entries_unpacked = run_workers(splits, num_entries, [&](IndexRange range) {
        return unpack_range(package_path, unpack_folder, range, options.verbose);
    });

    log_info(string_format("info.files_unpacked", total_entries_unpacked));
    return total_entries_unpacked;
}
