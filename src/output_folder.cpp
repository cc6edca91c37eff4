#include "output_folder.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

fs::path prepare_unpack_folder(const fs::path& package_path) {
    // Without an extension the stem is the package itself; there is no name left for the folder.
    if (!package_path.has_extension() || !package_path.has_stem()) {
        throw UnpackException(UnpackErrc::NoExtension, string_format("error.no_extension", package_path.string()));
    }

    fs::path unpack_folder = package_path;
    unpack_folder.replace_extension();

    std::error_code ec;
    fs::file_status status = fs::status(unpack_folder, ec);
    if (ec && status.type() != fs::file_type::not_found) {
        throw UnpackException(UnpackErrc::OutputFolder, string_format("error.stat_failed", unpack_folder.string()) + ": " + ec.message());
    }

    if (fs::is_directory(status)) {
        log_info(string_format("info.deleting_folder", unpack_folder.string()));
        fs::remove_all(unpack_folder, ec);
        if (ec) {
            throw UnpackException(UnpackErrc::OutputFolder, string_format("error.remove_dir_failed", unpack_folder.string()) + ": " + ec.message());
        }
    } else if (fs::exists(status)) {
        // Never clobber an unrelated file with the unpack folder.
        throw UnpackException(UnpackErrc::OutputIsFile, string_format("error.output_is_file", unpack_folder.string()));
    }

    fs::create_directory(unpack_folder, ec);
    if (ec) {
        throw UnpackException(UnpackErrc::OutputFolder, string_format("error.create_dir_failed", unpack_folder.string()) + ": " + ec.message());
    }
    return unpack_folder;
}
