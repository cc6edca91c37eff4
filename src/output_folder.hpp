#pragma once

#include <filesystem>

// Returns the folder a package unpacks into: the package path without its
// extension. A directory already there is deleted and recreated empty.
// Throws UnpackException (NoExtension, OutputIsFile, OutputFolder).
std::filesystem::path prepare_unpack_folder(const std::filesystem::path& package_path);
