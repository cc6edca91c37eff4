#pragma once

#include "archive_handle.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <string>
#include <vector>

// A forward-only byte source, consumed once.
class EntryStream {
public:
    virtual ~EntryStream() = default;

    // Reads up to size bytes into buffer. Returns 0 once the stream is exhausted.
    virtual std::size_t read(char* buffer, std::size_t size) = 0;
};

// Decompresses a gzip byte stream on the fly.
// Throws UnpackException (Decompress) if the source is not valid gzip data.
class GzipStream : public EntryStream {
public:
    explicit GzipStream(EntryStream& source);

    GzipStream(const GzipStream&) = delete;
    GzipStream& operator=(const GzipStream&) = delete;

    std::size_t read(char* buffer, std::size_t size) override;

private:
    static la_ssize_t read_source(struct archive* a, void* client_data, const void** buffer);
    [[noreturn]] void throw_decompress_error();

    EntryStream& source_;
    std::vector<char> block_;
    std::exception_ptr source_error_;
    ArchiveReadHandle archive_;
};

// Writes the remainder of the stream to target, replacing any existing file.
void copy_stream_to_file(EntryStream& in, const std::filesystem::path& target);

std::string read_stream_fully(EntryStream& in);
