#pragma once

#include "archive_handle.hpp"
#include "stream.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

// One entry fetched from a PackageArchive. The data stream reads from the
// archive it came from and is only valid until the next entry_at() call.
struct ArchiveEntry {
    std::size_t index = 0;
    std::string name;
    std::filesystem::path path;
    bool is_directory = false;
    std::unique_ptr<EntryStream> data;
};

// Read-only, index-addressable view over the entries of a zip package.
// Not safe to share between threads; every worker opens its own.
class PackageArchive {
public:
    explicit PackageArchive(std::filesystem::path archive_path);

    PackageArchive(const PackageArchive&) = delete;
    PackageArchive& operator=(const PackageArchive&) = delete;
    PackageArchive(PackageArchive&&) noexcept = default;
    PackageArchive& operator=(PackageArchive&&) noexcept = default;

    const std::filesystem::path& path() const { return path_; }

    // Total number of entries. The first call scans the whole central directory.
    std::size_t entry_count();

    // Cheapest when called with ascending indices; going backwards reopens the file.
    ArchiveEntry entry_at(std::size_t index);

private:
    void reopen();

    std::filesystem::path path_;
    ArchiveReadHandle archive_;
    std::size_t next_index_ = 0;
    std::optional<std::size_t> entry_count_;
};
