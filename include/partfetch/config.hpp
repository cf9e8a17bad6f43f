#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace partfetch {

struct Config {
    std::filesystem::path dest_dir{"downloads"};
    int max_concurrent{3};
    bool extract{true};
    bool cleanup{false};
    std::string extractor{"7z"};
    long timeout_seconds{30};
    std::string log_file;
    bool verbose{false};
    bool show_help{false};
    std::vector<std::string> urls;
};

inline constexpr int kMaxConcurrentLimit = 16;

// Throws std::runtime_error on unknown options, missing values or out-of-range numbers.
[[nodiscard]] Config parseCommandLine(int argc, const char* const* argv);

void printUsage(const char* program_name);

} // namespace partfetch
