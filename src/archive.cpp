#include "archive.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <utility>

namespace fs = std::filesystem;

namespace {
    class ArchiveDataStream : public EntryStream {
    public:
        ArchiveDataStream(struct archive* a, std::string entry_name)
            : archive_(a), entry_name_(std::move(entry_name)) {}

        std::size_t read(char* buffer, std::size_t size) override {
            la_ssize_t n = archive_read_data(archive_, buffer, size);
            if (n < 0) {
                const char* err = archive_error_string(archive_);
                throw UnpackException(UnpackErrc::ArchiveRead, string_format("error.entry_read_failed", entry_name_) + ": " + (err ? err : get_string("error.unknown")));
            }
            return static_cast<std::size_t>(n);
        }

    private:
        struct archive* archive_;
        std::string entry_name_;
    };

    ArchiveReadHandle open_package(const fs::path& archive_path) {
        ArchiveReadHandle a(archive_read_new());
        if (!a) {
            throw UnpackException(UnpackErrc::ArchiveOpen, get_string("error.archive_alloc_failed"));
        }
        archive_read_support_format_zip_seekable(a.get());

        if (archive_read_open_filename(a.get(), archive_path.c_str(), 10240) != ARCHIVE_OK) {
            const char* err = archive_error_string(a.get());
            throw UnpackException(UnpackErrc::ArchiveOpen, string_format("error.open_archive_failed", archive_path.string()) + ": " + (err ? err : get_string("error.unknown")));
        }
        return a;
    }

    // Reads the next header. Returns false at the end of the archive.
    bool next_header(struct archive* a, struct archive_entry** entry, UnpackErrc errc, const fs::path& archive_path) {
        int r = archive_read_next_header(a, entry);
        if (r == ARCHIVE_EOF) return false;
        if (r < ARCHIVE_OK) {
            const char* err = archive_error_string(a);
            if (r < ARCHIVE_WARN) {
                throw UnpackException(errc, string_format("error.archive_header_failed", archive_path.string()) + ": " + (err ? err : get_string("error.fatal_read")));
            }
            log_warning(err ? err : get_string("error.unknown"));
        }
        return true;
    }
}

PackageArchive::PackageArchive(fs::path archive_path)
    : path_(std::move(archive_path)), archive_(open_package(path_)) {}

void PackageArchive::reopen() {
    archive_ = open_package(path_);
    next_index_ = 0;
}

std::size_t PackageArchive::entry_count() {
    if (!entry_count_) {
        // Scan with a separate handle so the read position of archive_ is kept.
        ArchiveReadHandle scan = open_package(path_);
        struct archive_entry* entry;
        std::size_t count = 0;
        while (next_header(scan.get(), &entry, UnpackErrc::ArchiveOpen, path_)) {
            ++count;
        }
        entry_count_ = count;
    }
    return *entry_count_;
}

ArchiveEntry PackageArchive::entry_at(std::size_t index) {
    if (index < next_index_) {
        reopen();
    }

    struct archive_entry* entry = nullptr;
    while (next_index_ <= index) {
        if (!next_header(archive_.get(), &entry, UnpackErrc::ArchiveRead, path_)) {
            throw UnpackException(UnpackErrc::ArchiveRead, string_format("error.entry_index_out_of_range", index, path_.string()));
        }
        ++next_index_;
    }

    const char* pathname = archive_entry_pathname(entry);
    ArchiveEntry result;
    result.index = index;
    result.name = pathname ? pathname : "";
    result.path = fs::path(result.name);
    result.is_directory = archive_entry_filetype(entry) == AE_IFDIR;
    result.data = std::make_unique<ArchiveDataStream>(archive_.get(), result.name);
    return result;
}
