#include "utils.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    std::mutex log_mutex;
    bool is_stdout_tty = false;
    bool is_stderr_tty = false;
    bool tty_check_performed = false;

    // Helper function to reduce code duplication in logging
    void log_internal(std::string_view prefix, std::string_view color, std::string_view msg, std::ostream& stream) {
        std::lock_guard<std::mutex> lock(log_mutex);

        if (!tty_check_performed) {
            is_stdout_tty = isatty(STDOUT_FILENO);
            is_stderr_tty = isatty(STDERR_FILENO);
            tty_check_performed = true;
        }

        bool current_stream_is_tty = false;
        if (&stream == &std::cout) {
            current_stream_is_tty = is_stdout_tty;
        } else if (&stream == &std::cerr) {
            current_stream_is_tty = is_stderr_tty;
        }

        if (current_stream_is_tty) {
            stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
        } else {
            stream << prefix << msg << std::endl;
        }
    }
}

void log_info(std::string_view msg) {
    log_internal(get_string("info.log_prefix"), COLOR_GREEN, msg, std::cout);
}

void log_warning(std::string_view msg) {
    log_internal(get_string("warning.prefix") + " ", COLOR_YELLOW, msg, std::cerr);
}

void log_error(std::string_view msg) {
    log_internal(get_string("error.prefix") + " ", COLOR_RED, msg, std::cerr);
}

void ensure_dir_exists(const fs::path& path) {
    // create_directories reports an existing directory as success, which also
    // covers another worker creating the same ancestor first.
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw UnpackException(UnpackErrc::EntryWrite, string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        throw UnpackException(UnpackErrc::EntryWrite, string_format("error.path_not_dir", path.string()));
    }
}

fs::path validate_entry_path(const fs::path& entry_path, const fs::path& root) {
    if (entry_path.parent_path().is_absolute()) {
        throw UnpackException(UnpackErrc::AbsoluteEntryPath, string_format("error.absolute_entry_path", entry_path.string()));
    }

    fs::path normalized = entry_path.lexically_normal();
    for (const auto& component : normalized) {
        if (component == "..") {
            throw UnpackException(UnpackErrc::PathTraversal, string_format("error.entry_path_traversal", entry_path.string()));
        }
    }
    return root / normalized;
}
