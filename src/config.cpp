#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <charconv>
#include <string>
#include <thread>

std::size_t detect_worker_count() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores == 0 ? 1 : static_cast<std::size_t>(cores);
}

std::size_t parse_worker_count(const std::string& value) {
    std::size_t workers = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, workers);
    if (value.empty() || ec != std::errc() || ptr != last || workers == 0) {
        throw SlpkException(string_format("error.invalid_jobs", value));
    }
    return workers;
}
