#include "partfetch/progress.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace partfetch {

std::string OverallProgress::summary() const {
    return fmt::format("{}/{} done", done_count, total_count);
}

OverallProgress aggregateProgress(const std::vector<TransferItem>& items) {
    OverallProgress progress;
    progress.total_count = items.size();

    std::uint64_t total_size = 0;
    std::uint64_t transferred = 0;
    for (const auto& item : items) {
        if (item.status == TransferStatus::Done) {
            ++progress.done_count;
        }
        const std::uint64_t size = item.size.value_or(0);
        total_size += size;
        transferred += std::min(item.bytes_transferred,
                                item.size.value_or(item.bytes_transferred));
    }

    if (total_size > 0) {
        progress.fraction = std::min(
            1.0, static_cast<double>(transferred) / static_cast<double>(total_size));
    } else if (!items.empty()) {
        progress.fraction =
            static_cast<double>(progress.done_count) / static_cast<double>(items.size());
    }
    return progress;
}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace partfetch
