#pragma once

#include "archive.hpp"

#include <filesystem>

enum class EntryOutcome {
    Copied,
    Decompressed,
    FormattedJson,
    Directory,
    Skipped
};

// Materializes one archive entry below unpack_folder:
//   *.json.gz  -> gunzipped and re-indented JSON without the .gz suffix
//   *.gz       -> gunzipped bytes without the .gz suffix
//   otherwise  -> raw bytes under the entry's own name
// Entries with neither a parent nor a file name are skipped.
// Throws UnpackException; the entry's data stream is consumed.
EntryOutcome unpack_entry(ArchiveEntry& entry, const std::filesystem::path& unpack_folder, bool verbose);
