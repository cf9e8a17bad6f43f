#pragma once

#include "http_client.hpp"
#include "progress.hpp"
#include "transfer_event.hpp"
#include "transfer_item.hpp"
#include "transfer_task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace partfetch {

struct SchedulerOptions {
    int max_concurrent{3};
    std::filesystem::path dest_dir{"downloads"};
    TaskOptions task{};
};

// Owns the item collection and one task per admitted item. Every mutation happens on the
// thread that calls into the scheduler; tasks talk back through the event channel only.
class Scheduler {
public:
    using BatchFinishedCallback = std::function<void(const std::vector<TransferItem>&)>;

    Scheduler(HttpClientPtr http, SchedulerOptions options);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Appends a Queued item for future admission and pumps. Returns its index.
    std::size_t addItem(std::string url);

    void pump();
    // Requests admission of every item that is not Done.
    void start();
    void pause(const std::vector<std::size_t>& indices);
    void resume(const std::vector<std::size_t>& indices);
    void cancel(const std::vector<std::size_t>& indices);
    void cancelAll();
    void remove(const std::vector<std::size_t>& indices);
    // Drops Done, Error and Canceled items and reindexes the rest. Files stay on disk.
    void clearFinished();

    void setMaxConcurrent(int max_concurrent);
    [[nodiscard]] int maxConcurrent() const;

    // Applies queued task events. Returns how many were consumed.
    std::size_t processEvents();
    std::size_t waitAndProcess(std::chrono::milliseconds timeout);

    // Invoked once each time the whole collection becomes terminal after an admission.
    void onBatchFinished(BatchFinishedCallback callback);

    [[nodiscard]] std::vector<TransferItem> snapshot() const;
    [[nodiscard]] OverallProgress progress() const;
    [[nodiscard]] std::size_t runningCount() const;
    [[nodiscard]] bool allTerminal() const;
    [[nodiscard]] bool hasActiveTasks() const;

private:
    struct TaskSlot {
        TransferTaskPtr task;
        std::uint64_t generation{0};
    };

    void pumpLocked();
    void enforceCeilingLocked();
    void applyEventLocked(const TransferEvent& event);
    bool setStatusLocked(TransferItem& item, TransferStatus status);
    // Applies Done or Error from a finished attempt, overriding a pause it never reached.
    bool settleLocked(TransferItem& item, TransferStatus status);
    void compactLocked(const std::function<bool(const TransferItem&)>& drop);
    void reapRetiredLocked();
    [[nodiscard]] std::size_t runningCountLocked() const;
    [[nodiscard]] bool allTerminalLocked() const;
    // Releases the lock and runs the batch callback if the batch just completed.
    void finishBatchIfDone(std::unique_lock<std::mutex>& lock);

    HttpClientPtr http_;
    SchedulerOptions options_;
    EventChannel events_;

    mutable std::mutex mutex_;
    std::vector<TransferItem> items_;
    std::map<std::size_t, TaskSlot> tasks_;
    std::vector<TransferTaskPtr> retired_;
    std::uint64_t next_task_id_{1};
    bool batch_armed_{false};
    BatchFinishedCallback batch_finished_;
};

} // namespace partfetch
