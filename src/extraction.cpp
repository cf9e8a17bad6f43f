#include "partfetch/extraction.hpp"

#include "partfetch/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace partfetch {

namespace fs = std::filesystem;

namespace {

constexpr std::array<const char*, 4> kArchiveExtensions = {".rar", ".zip", ".7z", ".001"};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool hasArchiveExtension(const std::string& lower) {
    return std::any_of(kArchiveExtensions.begin(), kArchiveExtensions.end(),
                       [&lower](const char* ext) { return endsWith(lower, ext); });
}

std::vector<std::string> sortedFileNames(const fs::path& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            names.push_back(it->path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace

bool isArchiveFirstPart(const std::string& name) {
    const std::string lower = lowercase(name);
    return lower.find(".part1.") != std::string::npos || hasArchiveExtension(lower);
}

std::optional<fs::path> findFirstArchivePart(const fs::path& dir) {
    for (const auto& name : sortedFileNames(dir)) {
        if (isArchiveFirstPart(name)) {
            return dir / name;
        }
    }
    return std::nullopt;
}

std::size_t cleanupParts(const fs::path& dir) {
    std::size_t removed = 0;
    for (const auto& name : sortedFileNames(dir)) {
        const std::string lower = lowercase(name);
        if (!hasArchiveExtension(lower) && lower.find(".part") == std::string::npos) {
            continue;
        }
        std::error_code ec;
        if (fs::remove(dir / name, ec)) {
            ++removed;
        } else if (ec) {
            spdlog::debug("Could not delete {}: {}", name, ec.message());
        }
    }
    return removed;
}

CommandExtractor::CommandExtractor(std::string program) : program_(std::move(program)) {}

void CommandExtractor::extract(const fs::path& archive, const fs::path& output_dir) {
    const std::string out_flag = "-o" + output_dir.string();
    const std::string archive_arg = archive.string();
    std::vector<char*> argv = {const_cast<char*>(program_.c_str()),
                               const_cast<char*>("x"),
                               const_cast<char*>("-y"),
                               const_cast<char*>(out_flag.c_str()),
                               const_cast<char*>(archive_arg.c_str()),
                               nullptr};

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    // The progress panel owns stdout.
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, program_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        throw ExtractionError(fmt::format("Cannot start {}: {}", program_, std::strerror(rc)));
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw ExtractionError(fmt::format("Lost track of {}: {}", program_,
                                              std::strerror(errno)));
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw ExtractionError(fmt::format("{} exited with status {}", program_,
                                          WIFEXITED(status) ? WEXITSTATUS(status) : -1));
    }
}

ExtractionTrigger::ExtractionTrigger(ArchiveExtractor& extractor, ExtractionOptions options)
    : extractor_(extractor), options_(options) {}

ExtractionOutcome ExtractionTrigger::run(const fs::path& dest_dir) {
    ExtractionOutcome outcome;
    if (!options_.enabled) {
        outcome.result = ExtractionResult::Disabled;
        return outcome;
    }

    const auto archive = findFirstArchivePart(dest_dir);
    if (!archive) {
        outcome.result = ExtractionResult::NotFound;
        outcome.message = "No archive found";
        spdlog::info("No archive found in {}", dest_dir.string());
        return outcome;
    }

    outcome.archive = *archive;
    spdlog::info("Extracting {}", archive->filename().string());
    try {
        extractor_.extract(*archive, dest_dir);
    } catch (const std::exception& ex) {
        outcome.result = ExtractionResult::Failed;
        outcome.message = ex.what();
        spdlog::error("Extraction failed: {}", ex.what());
        return outcome;
    }

    outcome.result = ExtractionResult::Extracted;
    outcome.message = "Extraction complete";
    if (options_.cleanup) {
        outcome.removed = cleanupParts(dest_dir);
        spdlog::info("Removed {} part files", outcome.removed);
    }
    return outcome;
}

} // namespace partfetch
