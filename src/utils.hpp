#pragma once

#include "exception.hpp"
#include <string>
#include <string_view>
#include <filesystem>

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

// Log functions. Safe to call from several workers at once.
void log_info(std::string_view msg);
void log_warning(std::string_view msg);
void log_error(std::string_view msg);

// Filesystem utilities
void ensure_dir_exists(const std::filesystem::path& path);

// Maps an archive entry path below root.
// Throws UnpackException if the entry would land outside of root.
std::filesystem::path validate_entry_path(const std::filesystem::path& entry_path, const std::filesystem::path& root);
