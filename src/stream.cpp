#include "stream.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <archive_entry.h>

#include <fstream>

namespace fs = std::filesystem;

namespace {
    constexpr std::size_t BLOCK_SIZE = 8192;
}

GzipStream::GzipStream(EntryStream& source)
    : source_(source), block_(BLOCK_SIZE), archive_(archive_read_new()) {
    if (!archive_) {
        throw UnpackException(UnpackErrc::Decompress, get_string("error.archive_alloc_failed"));
    }
    archive_read_support_filter_gzip(archive_.get());
    archive_read_support_format_raw(archive_.get());

    if (archive_read_open(archive_.get(), this, nullptr, &GzipStream::read_source, nullptr) != ARCHIVE_OK) {
        throw_decompress_error();
    }

    struct archive_entry* entry;
    int r = archive_read_next_header(archive_.get(), &entry);
    if (r == ARCHIVE_EOF) {
        throw UnpackException(UnpackErrc::Decompress, get_string("error.not_gzip"));
    }
    if (r < ARCHIVE_WARN) {
        throw_decompress_error();
    }

    // The raw format accepts anything; without the gzip filter the data was not compressed.
    if (archive_filter_code(archive_.get(), 0) != ARCHIVE_FILTER_GZIP) {
        throw UnpackException(UnpackErrc::Decompress, get_string("error.not_gzip"));
    }
}

std::size_t GzipStream::read(char* buffer, std::size_t size) {
    la_ssize_t n = archive_read_data(archive_.get(), buffer, size);
    if (n < 0) {
        throw_decompress_error();
    }
    return static_cast<std::size_t>(n);
}

la_ssize_t GzipStream::read_source(struct archive* a, void* client_data, const void** buffer) {
    auto* self = static_cast<GzipStream*>(client_data);
    // Exceptions must not unwind through libarchive; park them until control is back.
    try {
        *buffer = self->block_.data();
        return static_cast<la_ssize_t>(self->source_.read(self->block_.data(), self->block_.size()));
    } catch (const std::exception& e) {
        self->source_error_ = std::current_exception();
        archive_set_error(a, ARCHIVE_ERRNO_MISC, "%s", e.what());
        return -1;
    } catch (...) {
        self->source_error_ = std::current_exception();
        archive_set_error(a, ARCHIVE_ERRNO_MISC, "%s", "source read failed");
        return -1;
    }
}

void GzipStream::throw_decompress_error() {
    if (source_error_) {
        std::rethrow_exception(source_error_);
    }
    const char* err = archive_error_string(archive_.get());
    throw UnpackException(UnpackErrc::Decompress, get_string("error.decompress_failed") + ": " + (err ? err : get_string("error.unknown")));
}

void copy_stream_to_file(EntryStream& in, const fs::path& target) {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw UnpackException(UnpackErrc::EntryWrite, string_format("error.create_file_failed", target.string()));
    }

    char buffer[BLOCK_SIZE];
    std::size_t n;
    while ((n = in.read(buffer, sizeof(buffer))) > 0) {
        if (!out.write(buffer, static_cast<std::streamsize>(n))) {
            throw UnpackException(UnpackErrc::EntryWrite, string_format("error.write_file_failed", target.string()));
        }
    }

    out.close();
    if (!out) {
        throw UnpackException(UnpackErrc::EntryWrite, string_format("error.write_file_failed", target.string()));
    }
}

std::string read_stream_fully(EntryStream& in) {
    std::string content;
    char buffer[BLOCK_SIZE];
    std::size_t n;
    while ((n = in.read(buffer, sizeof(buffer))) > 0) {
        content.append(buffer, n);
    }
    return content;
}
