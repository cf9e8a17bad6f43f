#pragma once

#include "transfer_item.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace partfetch {

enum class TransferEventKind {
    Progress,
    Status,
    Failed,
    Finished
};

struct TransferEvent {
    std::uint64_t task_id{0};
    std::uint64_t generation{0};
    TransferEventKind kind{TransferEventKind::Progress};
    std::uint64_t bytes{0};
    std::optional<std::uint64_t> size;
    TransferStatus status{TransferStatus::Downloading};
    // Error text for Failed, final path for Finished.
    std::string message;
};

// Many task threads push, the controller drains. FIFO per producer.
class EventChannel {
public:
    void push(TransferEvent event);
    [[nodiscard]] std::vector<TransferEvent> drain();

    // Blocks until something was pushed or the timeout expired. Returns true if events
    // are pending.
    bool waitFor(std::chrono::milliseconds timeout);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferEvent> events_;
};

} // namespace partfetch
