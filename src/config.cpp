#include "partfetch/config.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace partfetch {

namespace {

long parseNumber(const std::string& option, const std::string& value, long min, long max) {
    long number = 0;
    try {
        std::size_t consumed = 0;
        number = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }

    if (number < min || number > max) {
        throw std::runtime_error(option + " must be between " + std::to_string(min) + " and " +
                                 std::to_string(max));
    }
    return number;
}

} // namespace

Config parseCommandLine(int argc, const char* const* argv) {
    Config config;
    int arg_index = 1;

    auto requireValue = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw std::runtime_error("Missing value for " + option);
        }
        arg_index += 2;
        return argv[arg_index - 1];
    };

    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];

        if (option == "-d") {
            config.dest_dir = requireValue(option);
        } else if (option == "-j") {
            config.max_concurrent =
                static_cast<int>(parseNumber(option, requireValue(option), 1, kMaxConcurrentLimit));
        } else if (option == "-x") {
            config.extractor = requireValue(option);
        } else if (option == "--timeout") {
            config.timeout_seconds = parseNumber(option, requireValue(option), 1, 3600);
        } else if (option == "--log-file") {
            config.log_file = requireValue(option);
        } else if (option == "--no-extract") {
            config.extract = false;
            ++arg_index;
        } else if (option == "--cleanup") {
            config.cleanup = true;
            ++arg_index;
        } else if (option == "--verbose") {
            config.verbose = true;
            ++arg_index;
        } else if (option == "-h" || option == "--help") {
            config.show_help = true;
            return config;
        } else if (option == "--") {
            ++arg_index;
            break;
        } else {
            throw std::runtime_error("Unknown option: " + option);
        }
    }

    for (; arg_index < argc; ++arg_index) {
        config.urls.emplace_back(argv[arg_index]);
    }
    if (config.urls.empty()) {
        throw std::runtime_error("No URLs given");
    }
    return config;
}

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <url1> [<url2> ...]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>      Download directory (default: ./downloads)\n"
              << "  -j <n>              Simultaneous transfers, 1-" << kMaxConcurrentLimit
              << " (default: 3)\n"
              << "  -x <program>        Extractor with a 7-Zip command line (default: 7z)\n"
              << "  --no-extract        Do not extract after all parts finished\n"
              << "  --cleanup           Delete parts after a successful extraction\n"
              << "  --timeout <sec>     Connect and stall timeout (default: 30)\n"
              << "  --log-file <path>   Write the log to a file\n"
              << "  --verbose           Debug logging\n"
              << "  -h, --help          Show this message" << std::endl;
}

} // namespace partfetch
