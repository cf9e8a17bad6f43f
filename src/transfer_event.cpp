#include "partfetch/transfer_event.hpp"

#include <iterator>
#include <utility>

namespace partfetch {

void EventChannel::push(TransferEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

std::vector<TransferEvent> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferEvent> out(std::make_move_iterator(events_.begin()),
                                   std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

bool EventChannel::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
}

} // namespace partfetch
