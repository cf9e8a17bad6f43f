#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace partfetch {

enum class TransferStatus {
    Queued,
    Downloading,
    Paused,
    Done,
    Error,
    Canceled
};

inline constexpr const char* kTempSuffix = ".part";
inline constexpr const char* kFallbackFilename = "download.bin";

[[nodiscard]] const char* statusName(TransferStatus status) noexcept;

// Done, Error and Canceled: nothing moves again without an explicit re-admission.
[[nodiscard]] bool isTerminal(TransferStatus status) noexcept;

[[nodiscard]] bool canTransition(TransferStatus from, TransferStatus to) noexcept;

// Last segment of the URL path, percent-decoded and stripped of path separators.
// Falls back to kFallbackFilename when the URL has no usable segment.
[[nodiscard]] std::string filenameFromUrl(const std::string& url);

struct TransferItem {
    TransferItem() = default;
    TransferItem(std::size_t index, std::string url, std::filesystem::path dest_dir);

    std::size_t index{0};
    std::string url;
    std::filesystem::path dest_dir;
    std::string filename;
    std::optional<std::uint64_t> size;
    std::uint64_t bytes_transferred{0};
    TransferStatus status{TransferStatus::Queued};
    std::optional<std::string> error;

    // Set by resume()/start(); a held Paused, Error or Canceled item stays out of pump()
    // until this is raised.
    bool admission_requested{false};

    const std::string& resolveFilename();
    [[nodiscard]] std::filesystem::path finalPath() const;
    [[nodiscard]] std::filesystem::path tempPath() const;
};

} // namespace partfetch
