#pragma once

#include "http_client.hpp"
#include "transfer_event.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace partfetch {

struct TaskOptions {
    std::size_t chunk_size{1024 * 1024};
    std::chrono::milliseconds progress_interval{50};
};

// Fetches one URL into <final_path>.part and renames it on success. Reports through the
// event channel only; owns one worker thread that is reused across attempts.
class TransferTask {
public:
    TransferTask(std::uint64_t id,
                 std::string url,
                 std::filesystem::path final_path,
                 HttpClientPtr http,
                 EventChannel& events,
                 TaskOptions options = {});
    ~TransferTask();

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    [[nodiscard]] std::uint64_t id() const;

    // Resumes a paused attempt in place, otherwise starts a new attempt. Returns the
    // generation that events of the admitted attempt will carry.
    std::uint64_t run();

    void requestPause();
    void requestCancel();

    [[nodiscard]] bool isActive() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

using TransferTaskPtr = std::shared_ptr<TransferTask>;

} // namespace partfetch
