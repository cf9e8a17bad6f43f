#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace partfetch {

// Matches ".part1." anywhere, or a name ending in .rar, .zip, .7z or .001. Case-insensitive.
[[nodiscard]] bool isArchiveFirstPart(const std::string& name);

// First matching regular file of `dir` in lexicographic order.
[[nodiscard]] std::optional<std::filesystem::path> findFirstArchivePart(
    const std::filesystem::path& dir);

// Best-effort removal of archive volumes and leftover temp files. Returns how many files
// were deleted; failures are skipped.
std::size_t cleanupParts(const std::filesystem::path& dir);

// External tool that unpacks an archive into a directory. Throws ExtractionError.
class ArchiveExtractor {
public:
    virtual ~ArchiveExtractor() = default;

    virtual void extract(const std::filesystem::path& archive,
                         const std::filesystem::path& output_dir) = 0;
};

// Runs `<program> x -y -o<output_dir> <archive>` (7-Zip command line) and waits for it.
class CommandExtractor final : public ArchiveExtractor {
public:
    explicit CommandExtractor(std::string program = "7z");

    void extract(const std::filesystem::path& archive,
                 const std::filesystem::path& output_dir) override;

private:
    std::string program_;
};

struct ExtractionOptions {
    bool enabled{true};
    bool cleanup{false};
};

enum class ExtractionResult {
    Disabled,
    NotFound,
    Extracted,
    Failed
};

struct ExtractionOutcome {
    ExtractionResult result{ExtractionResult::Disabled};
    std::filesystem::path archive;
    std::string message;
    std::size_t removed{0};
};

class ExtractionTrigger {
public:
    ExtractionTrigger(ArchiveExtractor& extractor, ExtractionOptions options);

    // Called once per finished batch. Never throws; failures land in the outcome.
    ExtractionOutcome run(const std::filesystem::path& dest_dir);

private:
    ArchiveExtractor& extractor_;
    ExtractionOptions options_;
};

} // namespace partfetch
