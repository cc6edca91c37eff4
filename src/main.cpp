#include "config.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "unpacker.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {
    constexpr int EXIT_FATAL = 2;

    void print_usage(const cxxopts::Options& options) {
        std::cerr << options.help({""});
        std::cerr << get_string("info.unpack_desc") << std::endl;
    }
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.positional_help(get_string("info.positional_usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("v,verbose", get_string("help.verbose"), cxxopts::value<bool>()->default_value("false"))
            ("j,jobs", get_string("help.jobs"), cxxopts::value<std::string>())
            ("packages", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"packages"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("packages")) {
            print_usage(options);
            return 1;
        }

        UnpackOptions unpack_options;
        unpack_options.verbose = result["verbose"].as<bool>();
        unpack_options.workers = result.count("jobs")
            ? parse_worker_count(result["jobs"].as<std::string>())
            : detect_worker_count();

        for (const auto& package : result["packages"].as<std::vector<std::string>>()) {
            unpack_package(package, unpack_options);
        }

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const WorkerAbortedException& e) {
        log_error(string_format("error.fatal_error", e.what()));
        return EXIT_FATAL;
    } catch (const PartialUnpackException& e) {
        log_error(string_format("error.partial_unpack", e.entries_unpacked(), e.total_entries()));
        return 1;
    } catch (const SlpkException& e) {
        log_error(string_format("error.slpk_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
