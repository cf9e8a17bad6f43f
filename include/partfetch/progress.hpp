#pragma once

#include "transfer_item.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace partfetch {

struct OverallProgress {
    double fraction{0.0};
    std::size_t done_count{0};
    std::size_t total_count{0};

    // "<done>/<total> done"
    [[nodiscard]] std::string summary() const;
};

// Byte-weighted when any size is known, otherwise the fraction of Done items.
[[nodiscard]] OverallProgress aggregateProgress(const std::vector<TransferItem>& items);

[[nodiscard]] std::string formatSize(std::uint64_t bytes);

} // namespace partfetch
