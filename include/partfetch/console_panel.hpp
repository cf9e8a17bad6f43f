#pragma once

#include "progress.hpp"
#include "transfer_item.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace partfetch {

// Redraws a fixed block of terminal lines in place with ANSI cursor movement.
class ConsolePanel {
public:
    explicit ConsolePanel(std::ostream& out);

    void render(const std::vector<TransferItem>& items, const OverallProgress& overall);
    void printLine(const std::string& line);

    [[nodiscard]] static std::string buildPanel(const std::vector<TransferItem>& items,
                                                const OverallProgress& overall);
    [[nodiscard]] static std::string formatItemLine(const TransferItem& item);

private:
    std::ostream& out_;
    std::size_t previous_lines_{0};
};

} // namespace partfetch
