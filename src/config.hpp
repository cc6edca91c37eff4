#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#ifndef SLPK_L10N_DIR
#define SLPK_L10N_DIR "/usr/share/slpk/l10n"
#endif

inline const std::filesystem::path L10N_DIR = SLPK_L10N_DIR;

// Settings for one unpack run. Built once by the front end and handed down.
struct UnpackOptions {
    bool verbose = false;
    std::size_t workers = 1;
};

// One worker per available processing unit, never less than one.
std::size_t detect_worker_count();

// Parses a --jobs value. Throws SlpkException unless it is a positive integer.
std::size_t parse_worker_count(const std::string& value);
