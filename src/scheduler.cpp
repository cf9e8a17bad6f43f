#include "partfetch/scheduler.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace partfetch {

namespace {

bool isAdmissible(const TransferItem& item) {
    switch (item.status) {
    case TransferStatus::Queued:
        return true;
    case TransferStatus::Paused:
    case TransferStatus::Error:
    case TransferStatus::Canceled:
        return item.admission_requested;
    default:
        return false;
    }
}

} // namespace

Scheduler::Scheduler(HttpClientPtr http, SchedulerOptions options)
    : http_(std::move(http)), options_(std::move(options)) {
    options_.max_concurrent = std::max(1, options_.max_concurrent);
}

Scheduler::~Scheduler() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [index, slot] : tasks_) {
        slot.task->requestCancel();
    }
    for (auto& task : retired_) {
        task->requestCancel();
    }
}

std::size_t Scheduler::addItem(std::string url) {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::size_t index = items_.size();
    TransferItem item(index, std::move(url), options_.dest_dir);
    item.resolveFilename();
    spdlog::debug("Queued #{} {} -> {}", index, item.url, item.finalPath().string());
    items_.push_back(std::move(item));

    pumpLocked();
    finishBatchIfDone(lock);
    return index;
}

void Scheduler::pump() {
    std::unique_lock<std::mutex> lock(mutex_);
    pumpLocked();
    finishBatchIfDone(lock);
}

void Scheduler::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (auto& item : items_) {
        if (item.status != TransferStatus::Done) {
            item.admission_requested = true;
        }
    }
    pumpLocked();
    finishBatchIfDone(lock);
}

void Scheduler::pause(const std::vector<std::size_t>& indices) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (const std::size_t index : indices) {
        const auto slot = tasks_.find(index);
        if (index >= items_.size() || slot == tasks_.end()) {
            continue;
        }
        TransferItem& item = items_[index];
        if (item.status != TransferStatus::Downloading) {
            continue;
        }
        slot->second.task->requestPause();
        item.admission_requested = false;
        setStatusLocked(item, TransferStatus::Paused);
    }
    pumpLocked();
    finishBatchIfDone(lock);
}

void Scheduler::resume(const std::vector<std::size_t>& indices) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (const std::size_t index : indices) {
        if (index >= items_.size()) {
            continue;
        }
        TransferItem& item = items_[index];
        if (item.status == TransferStatus::Paused || item.status == TransferStatus::Error ||
            item.status == TransferStatus::Canceled) {
            item.admission_requested = true;
        }
    }
    pumpLocked();
    finishBatchIfDone(lock);
}

void Scheduler::cancel(const std::vector<std::size_t>& indices) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (const std::size_t index : indices) {
        const auto slot = tasks_.find(index);
        if (index >= items_.size() || slot == tasks_.end()) {
            continue;
        }
        TransferItem& item = items_[index];
        slot->second.task->requestCancel();
        item.admission_requested = false;
        if (item.status == TransferStatus::Downloading || item.status == TransferStatus::Paused) {
            setStatusLocked(item, TransferStatus::Canceled);
        }
    }
    pumpLocked();
    finishBatchIfDone(lock);
}

void Scheduler::cancelAll() {
    std::vector<std::size_t> indices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [index, slot] : tasks_) {
            indices.push_back(index);
        }
    }
    cancel(indices);
}

void Scheduler::remove(const std::vector<std::size_t>& indices) {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::set<std::size_t> doomed(indices.begin(), indices.end());
    compactLocked([&doomed](const TransferItem& item) { return doomed.count(item.index) > 0; });
    pumpLocked();
    finishBatchIfDone(lock);
}

void Scheduler::clearFinished() {
    std::unique_lock<std::mutex> lock(mutex_);
    compactLocked([](const TransferItem& item) { return isTerminal(item.status); });
    pumpLocked();
    finishBatchIfDone(lock);
}

void Scheduler::setMaxConcurrent(int max_concurrent) {
    std::unique_lock<std::mutex> lock(mutex_);
    options_.max_concurrent = std::max(1, max_concurrent);
    enforceCeilingLocked();
    pumpLocked();
    finishBatchIfDone(lock);
}

int Scheduler::maxConcurrent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.max_concurrent;
}

std::size_t Scheduler::processEvents() {
    const auto events = events_.drain();

    std::unique_lock<std::mutex> lock(mutex_);
    reapRetiredLocked();
    for (const auto& event : events) {
        applyEventLocked(event);
    }
    pumpLocked();
    finishBatchIfDone(lock);
    return events.size();
}

std::size_t Scheduler::waitAndProcess(std::chrono::milliseconds timeout) {
    events_.waitFor(timeout);
    return processEvents();
}

void Scheduler::onBatchFinished(BatchFinishedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_finished_ = std::move(callback);
}

std::vector<TransferItem> Scheduler::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_;
}

OverallProgress Scheduler::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aggregateProgress(items_);
}

std::size_t Scheduler::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runningCountLocked();
}

bool Scheduler::allTerminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allTerminalLocked();
}

bool Scheduler::hasActiveTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [index, slot] : tasks_) {
        if (slot.task->isActive()) {
            return true;
        }
    }
    return std::any_of(retired_.begin(), retired_.end(),
                       [](const TransferTaskPtr& task) { return task->isActive(); });
}

void Scheduler::pumpLocked() {
    const std::size_t running = runningCountLocked();
    const auto ceiling = static_cast<std::size_t>(options_.max_concurrent);
    if (running >= ceiling) {
        return;
    }

    std::size_t slots = ceiling - running;
    for (auto& item : items_) {
        if (slots == 0) {
            break;
        }
        if (!isAdmissible(item)) {
            continue;
        }

        TaskSlot& slot = tasks_[item.index];
        if (!slot.task) {
            slot.task = std::make_shared<TransferTask>(next_task_id_++, item.url, item.finalPath(),
                                                       http_, events_, options_.task);
        }
        if (!setStatusLocked(item, TransferStatus::Downloading)) {
            continue;
        }
        slot.generation = slot.task->run();
        item.admission_requested = false;
        batch_armed_ = true;
        --slots;
        spdlog::info("Started #{} {}", item.index, item.filename);
    }
}

void Scheduler::enforceCeilingLocked() {
    std::size_t running = runningCountLocked();
    const auto ceiling = static_cast<std::size_t>(options_.max_concurrent);
    // Park the latest admissions first; they resume in order once slots free up.
    for (auto it = items_.rbegin(); it != items_.rend() && running > ceiling; ++it) {
        if (it->status != TransferStatus::Downloading) {
            continue;
        }
        const auto slot = tasks_.find(it->index);
        if (slot != tasks_.end()) {
            slot->second.task->requestPause();
        }
        setStatusLocked(*it, TransferStatus::Paused);
        it->admission_requested = true;
        --running;
    }
}

void Scheduler::applyEventLocked(const TransferEvent& event) {
    const auto owner = std::find_if(tasks_.begin(), tasks_.end(), [&event](const auto& entry) {
        return entry.second.task->id() == event.task_id;
    });
    if (owner == tasks_.end() || owner->second.generation != event.generation ||
        owner->first >= items_.size()) {
        return;
    }

    TransferItem& item = items_[owner->first];
    switch (event.kind) {
    case TransferEventKind::Progress:
        item.bytes_transferred = event.bytes;
        if (event.size) {
            item.size = event.size;
        }
        if (item.size && item.bytes_transferred > *item.size) {
            item.size = item.bytes_transferred;
        }
        break;
    case TransferEventKind::Status:
        item.bytes_transferred = event.bytes;
        spdlog::debug("#{} reported {}", item.index, statusName(event.status));
        break;
    case TransferEventKind::Failed:
        if (settleLocked(item, TransferStatus::Error)) {
            item.error = event.message;
        }
        break;
    case TransferEventKind::Finished:
        item.bytes_transferred = event.bytes;
        item.size = event.size;
        if (settleLocked(item, TransferStatus::Done)) {
            spdlog::info("Finished #{} {}", item.index, event.message);
        }
        break;
    }
}

bool Scheduler::settleLocked(TransferItem& item, TransferStatus status) {
    if (item.status != TransferStatus::Paused) {
        return setStatusLocked(item, status);
    }
    // The attempt ended before it reached the pause point; it cannot be held any more.
    spdlog::debug("#{} ended while paused -> {}", item.index, statusName(status));
    item.status = status;
    item.admission_requested = false;
    item.error.reset();
    return true;
}

bool Scheduler::setStatusLocked(TransferItem& item, TransferStatus status) {
    if (item.status == status) {
        return true;
    }
    if (!canTransition(item.status, status)) {
        spdlog::warn("Rejected transition {} -> {} for #{}", statusName(item.status),
                     statusName(status), item.index);
        return false;
    }
    spdlog::debug("#{} {} -> {}", item.index, statusName(item.status), statusName(status));
    item.status = status;
    if (status != TransferStatus::Error) {
        item.error.reset();
    }
    return true;
}

void Scheduler::compactLocked(const std::function<bool(const TransferItem&)>& drop) {
    std::vector<TransferItem> kept;
    std::map<std::size_t, TaskSlot> rebound;
    kept.reserve(items_.size());

    for (auto& item : items_) {
        auto slot = tasks_.find(item.index);
        if (drop(item)) {
            spdlog::debug("Removed #{} {}", item.index, item.filename);
            if (slot != tasks_.end()) {
                slot->second.task->requestCancel();
                retired_.push_back(std::move(slot->second.task));
            }
            continue;
        }
        const std::size_t new_index = kept.size();
        if (slot != tasks_.end()) {
            rebound[new_index] = std::move(slot->second);
        }
        item.index = new_index;
        kept.push_back(std::move(item));
    }

    items_ = std::move(kept);
    tasks_ = std::move(rebound);
}

void Scheduler::reapRetiredLocked() {
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [](const TransferTaskPtr& task) { return !task->isActive(); }),
                   retired_.end());
}

std::size_t Scheduler::runningCountLocked() const {
    return static_cast<std::size_t>(
        std::count_if(items_.begin(), items_.end(), [](const TransferItem& item) {
            return item.status == TransferStatus::Downloading;
        }));
}

bool Scheduler::allTerminalLocked() const {
    return !items_.empty() && std::all_of(items_.begin(), items_.end(), [](const TransferItem& item) {
               return isTerminal(item.status);
           });
}

void Scheduler::finishBatchIfDone(std::unique_lock<std::mutex>& lock) {
    if (!batch_armed_ || !allTerminalLocked()) {
        return;
    }
    batch_armed_ = false;
    const auto items = items_;
    const auto callback = batch_finished_;
    lock.unlock();

    spdlog::info("All {} transfers reached a terminal state", items.size());
    if (callback) {
        callback(items);
    }
}

} // namespace partfetch
