#include "entry_processor.hpp"
#include "json_format.hpp"
#include "localization.hpp"
#include "stream.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {
    const fs::path GZIP_EXTENSION = ".gz";
    const fs::path JSON_EXTENSION = ".json";

    // Creates the directories leading up to the entry and returns the folder
    // the entry's file goes into.
    fs::path create_folder_for_entry(const fs::path& entry_target, const fs::path& entry_path, const fs::path& unpack_folder) {
        if (entry_path.parent_path().empty()) {
            return unpack_folder;
        }
        fs::path folder = entry_target.parent_path();
        ensure_dir_exists(folder);
        return folder;
    }
}

EntryOutcome unpack_entry(ArchiveEntry& entry, const fs::path& unpack_folder, bool verbose) {
    fs::path entry_target = validate_entry_path(entry.path, unpack_folder);
    const fs::path entry_path = entry.path.lexically_normal();
    const fs::path file_name = entry_path.filename();
    const bool has_file_name = !file_name.empty() && file_name != ".";

    if (entry_path.parent_path().empty() && !has_file_name) {
        // TODO: reject nameless entries instead of skipping them once packages
        // in the wild have been checked for them.
        return EntryOutcome::Skipped;
    }

    if (entry.is_directory || !has_file_name) {
        ensure_dir_exists(entry_target);
        return EntryOutcome::Directory;
    }

    fs::path target_folder = create_folder_for_entry(entry_target, entry_path, unpack_folder);

    if (entry_path.extension() == GZIP_EXTENSION) {
        fs::path non_gzip_name = entry_path.stem();
        fs::path target_file = target_folder / non_gzip_name;

        if (verbose) {
            log_info(string_format("info.decompress_entry", entry.name, target_file.string()));
        }

        GzipStream gz_stream(*entry.data);
        if (non_gzip_name.extension() == JSON_EXTENSION) {
            write_pretty_json(gz_stream, target_file);
            return EntryOutcome::FormattedJson;
        }
        copy_stream_to_file(gz_stream, target_file);
        return EntryOutcome::Decompressed;
    }

    fs::path target_file = target_folder / entry_path.filename();
    if (verbose) {
        log_info(string_format("info.copy_entry", entry.name, target_file.string()));
    }
    copy_stream_to_file(*entry.data, target_file);
    return EntryOutcome::Copied;
}
