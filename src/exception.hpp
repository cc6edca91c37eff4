#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

class SlpkException : public std::runtime_error {
public:
    explicit SlpkException(const std::string& message)
        : std::runtime_error(message) {}
};

enum class UnpackErrc {
    ArchiveOpen,
    ArchiveRead,
    NoExtension,
    OutputIsFile,
    OutputFolder,
    AbsoluteEntryPath,
    PathTraversal,
    EntryWrite,
    Decompress,
    JsonFormat
};

class UnpackException : public SlpkException {
public:
    UnpackException(UnpackErrc code, const std::string& message)
        : SlpkException(message), code_(code) {}

    UnpackErrc code() const { return code_; }

private:
    UnpackErrc code_;
};

// Raised once every worker has been joined and at least one of them failed.
// Carries the first worker error plus how far the run got.
class PartialUnpackException : public UnpackException {
public:
    PartialUnpackException(UnpackErrc code, const std::string& message, std::size_t entries_unpacked, std::size_t total_entries)
        : UnpackException(code, message), entries_unpacked_(entries_unpacked), total_entries_(total_entries) {}

    std::size_t entries_unpacked() const { return entries_unpacked_; }
    std::size_t total_entries() const { return total_entries_; }

private:
    std::size_t entries_unpacked_;
    std::size_t total_entries_;
};

// A worker died with something other than an SlpkException. Its state is unknown.
class WorkerAbortedException : public SlpkException {
public:
    explicit WorkerAbortedException(const std::string& message)
        : SlpkException(message) {}
};
