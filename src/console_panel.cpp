#include "partfetch/console_panel.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace partfetch {

namespace {

constexpr int kBarWidth = 30;
constexpr std::size_t kNameWidth = 24;

std::string progressBar(double ratio) {
    const int bar_pos = static_cast<int>(std::clamp(ratio, 0.0, 1.0) * kBarWidth);
    std::string bar;
    bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
    for (int i = 0; i < kBarWidth; ++i) {
        bar += (i < bar_pos) ? u8"█" : u8"░";
    }
    return bar;
}

} // namespace

ConsolePanel::ConsolePanel(std::ostream& out) : out_(out) {}

void ConsolePanel::render(const std::vector<TransferItem>& items, const OverallProgress& overall) {
    const std::string panel = buildPanel(items, overall);
    const auto current_lines =
        static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel << std::flush;
    previous_lines_ = current_lines;
}

void ConsolePanel::printLine(const std::string& line) {
    out_ << line << '\n' << std::flush;
    previous_lines_ = 0;
}

std::string ConsolePanel::buildPanel(const std::vector<TransferItem>& items,
                                     const OverallProgress& overall) {
    std::string panel;
    panel.reserve(items.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("partfetch ({} parts)\n", items.size());
    panel.append("--------------------------------------------------\n");

    for (const auto& item : items) {
        panel += formatItemLine(item);
        panel.push_back('\n');
    }

    panel.append("--------------------------------------------------\n");
    panel += fmt::format("Overall: [{}] {:>5.1f}%  {}\n", progressBar(overall.fraction),
                         overall.fraction * 100.0, overall.summary());
    panel.append("==================================================\n");
    return panel;
}

std::string ConsolePanel::formatItemLine(const TransferItem& item) {
    std::string name = item.filename.empty() ? filenameFromUrl(item.url) : item.filename;
    if (name.size() > kNameWidth) {
        name = name.substr(0, kNameWidth);
    }

    std::string line = fmt::format("{:>3} {:<24} ", item.index + 1, name);
    if (item.size && *item.size > 0) {
        const double ratio =
            static_cast<double>(item.bytes_transferred) / static_cast<double>(*item.size);
        line += fmt::format("[{}] {:>5.1f}% ({}/{})", progressBar(ratio), ratio * 100.0,
                            formatSize(item.bytes_transferred), formatSize(*item.size));
    } else {
        line += fmt::format("[{:^30}] {}", "size unknown", formatSize(item.bytes_transferred));
    }

    line += fmt::format("  {}", statusName(item.status));
    if (item.error) {
        line += fmt::format(": {}", *item.error);
    }
    return line;
}

} // namespace partfetch
