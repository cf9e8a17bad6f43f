#include "partfetch/transfer_task.hpp"

#include "partfetch/errors.hpp"

#include <condition_variable>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace partfetch {

namespace fs = std::filesystem;

class TransferTask::Impl {
public:
    Impl(std::uint64_t id,
         std::string url,
         fs::path final_path,
         HttpClientPtr http,
         EventChannel& events,
         TaskOptions options)
        : id_(id),
          url_(std::move(url)),
          final_path_(std::move(final_path)),
          http_(std::move(http)),
          events_(events),
          options_(options) {
        if (options_.chunk_size == 0) {
            options_.chunk_size = 1;
        }
        temp_path_ = final_path_;
        temp_path_ += kTempSuffix;
    }

    ~Impl() {
        requestCancel();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    [[nodiscard]] std::uint64_t id() const { return id_; }

    std::uint64_t run() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (active_ && !finishing_ && !canceled_) {
            paused_ = false;
            cv_.notify_all();
            return generation_;
        }

        ++generation_;
        if (active_) {
            // The running attempt is on its way out; the worker loops into a fresh one.
            restart_requested_ = true;
            paused_ = false;
            cv_.notify_all();
            return generation_;
        }

        lock.unlock();
        if (worker_.joinable()) {
            worker_.join();
        }
        lock.lock();
        active_ = true;
        finishing_ = false;
        canceled_ = false;
        paused_ = false;
        worker_ = std::thread([this]() { workerLoop(); });
        return generation_;
    }

    void requestPause() {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = true;
    }

    void requestCancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            canceled_ = true;
            restart_requested_ = false;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isActive() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

private:
    struct FileDeleter {
        void operator()(FILE* fp) const noexcept {
            if (fp) {
                std::fclose(fp);
            }
        }
    };

    using FilePtr = std::unique_ptr<FILE, FileDeleter>;

    // State of one attempt while the body streams in.
    struct Stream {
        std::uint64_t generation{0};
        std::uint64_t offset{0};
        std::uint64_t bytes{0};
        std::optional<std::uint64_t> total;
        FilePtr file;
        std::vector<char> buffer;
        std::chrono::steady_clock::time_point last_emit{};
        bool canceled{false};
        bool range_exhausted{false};
        long http_status{0};
        std::string io_error;
    };

    void workerLoop() {
        while (true) {
            std::uint64_t generation = 0;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                generation = generation_;
            }

            attempt(generation);

            std::lock_guard<std::mutex> lock(mutex_);
            if (restart_requested_) {
                restart_requested_ = false;
                finishing_ = false;
                canceled_ = false;
                paused_ = false;
                continue;
            }
            active_ = false;
            return;
        }
    }

    void attempt(std::uint64_t generation) {
        try {
            download(generation);
        } catch (const TransferError& ex) {
            fail(generation, ex.what());
        } catch (const fs::filesystem_error& ex) {
            fail(generation, ex.what());
        }
    }

    void download(std::uint64_t generation) {
        std::error_code ec;
        fs::create_directories(final_path_.parent_path(), ec);
        if (ec) {
            throw TransferError(fmt::format("Cannot create directory {}: {}",
                                            final_path_.parent_path().string(), ec.message()));
        }

        Stream stream;
        stream.generation = generation;

        if (fs::exists(temp_path_)) {
            stream.offset = fs::file_size(temp_path_);
        } else if (fs::exists(final_path_)) {
            const auto size = static_cast<std::uint64_t>(fs::file_size(final_path_));
            spdlog::info("{} already present, skipping download", final_path_.string());
            emitProgress(generation, size, size);
            finish(generation, size);
            return;
        }

        const ProbeResult probe = http_->probe(url_);
        if (probe.ok) {
            stream.total = probe.content_length;
            if (stream.offset > 0 && !probe.accepts_ranges) {
                spdlog::debug("{} does not advertise byte ranges, trying anyway", url_);
            }
        } else {
            spdlog::warn("Metadata probe failed for {}: {}", url_, probe.error);
        }

        if (stream.total && stream.offset > *stream.total) {
            spdlog::info("Partial file for {} is larger than the source, restarting", url_);
            stream.offset = 0;
        }

        stream.bytes = stream.offset;
        if (stopRequested()) {
            cancelAttempt(stream);
            return;
        }

        stream.buffer.reserve(options_.chunk_size);
        stream.last_emit = std::chrono::steady_clock::now();
        emitProgress(generation, stream.bytes, stream.total);

        FetchRequest request{url_, stream.offset};
        const FetchResult result = http_->fetch(
            request,
            [this, &stream](const ResponseHead& head) { return onHead(stream, head); },
            [this, &stream](const char* data, std::size_t size) {
                return onData(stream, data, size);
            });

        if (stream.canceled) {
            cancelAttempt(stream);
            return;
        }
        if (!stream.io_error.empty()) {
            throw TransferError(stream.io_error);
        }
        if (stream.range_exhausted) {
            finishExhaustedRange(stream);
            return;
        }
        if (stream.http_status != 0) {
            throw TransferError(fmt::format("HTTP {}", stream.http_status));
        }
        if (result.aborted) {
            throw TransferError("Transfer aborted");
        }
        if (!result.ok) {
            throw TransferError(result.error.empty() ? "Transfer failed" : result.error);
        }

        if (!stream.file && !openFile(stream, stream.offset > 0)) {
            throw TransferError(stream.io_error);
        }
        if (!flushChunk(stream, true)) {
            if (stream.canceled) {
                cancelAttempt(stream);
                return;
            }
            throw TransferError(stream.io_error);
        }
        closeFile(stream);
        complete(stream);
    }

    bool onHead(Stream& stream, const ResponseHead& head) {
        const long code = head.status_code;
        if (code == 416 && stream.offset > 0) {
            stream.range_exhausted = true;
            return false;
        }
        if (code < 200 || code >= 300) {
            stream.http_status = code;
            return false;
        }

        bool append = stream.offset > 0;
        if (append && code != 206) {
            spdlog::info("Server ignored range request for {}, restarting from zero", url_);
            stream.offset = 0;
            stream.bytes = 0;
            append = false;
            emitProgress(stream.generation, 0, stream.total);
        }

        if (!stream.total && head.content_length) {
            stream.total = *head.content_length + stream.offset;
        }
        return openFile(stream, append);
    }

    bool onData(Stream& stream, const char* data, std::size_t size) {
        stream.buffer.insert(stream.buffer.end(), data, data + size);
        if (stream.buffer.size() < options_.chunk_size) {
            return true;
        }
        return flushChunk(stream, false);
    }

    bool openFile(Stream& stream, bool append) {
        stream.file.reset(std::fopen(temp_path_.c_str(), append ? "ab" : "wb"));
        if (!stream.file) {
            stream.io_error = fmt::format("Cannot open {}", temp_path_.string());
            return false;
        }
        return true;
    }

    void closeFile(Stream& stream) {
        FILE* fp = stream.file.release();
        if (fp && std::fclose(fp) != 0) {
            throw TransferError(fmt::format("Cannot close {}", temp_path_.string()));
        }
    }

    // Writes the buffered chunk, then honours cancel and pause.
    bool flushChunk(Stream& stream, bool final_chunk) {
        if (!stream.buffer.empty()) {
            const std::size_t written =
                std::fwrite(stream.buffer.data(), 1, stream.buffer.size(), stream.file.get());
            if (written != stream.buffer.size() || std::fflush(stream.file.get()) != 0) {
                stream.io_error = fmt::format("Failed to write {}", temp_path_.string());
                return false;
            }
            stream.bytes += written;
            stream.buffer.clear();
        }

        const auto now = std::chrono::steady_clock::now();
        if (final_chunk || now - stream.last_emit >= options_.progress_interval) {
            emitProgress(stream.generation, stream.bytes, stream.total);
            stream.last_emit = now;
        }

        if (!waitWhilePaused(stream.generation, stream.bytes)) {
            stream.canceled = true;
            return false;
        }
        return true;
    }

    // Returns false when the attempt has to stop.
    bool waitWhilePaused(std::uint64_t generation, std::uint64_t bytes) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (canceled_) {
            return false;
        }
        if (!paused_) {
            return true;
        }

        lock.unlock();
        emitStatus(generation, TransferStatus::Paused, bytes);
        lock.lock();
        cv_.wait(lock, [this]() { return !paused_ || canceled_; });
        if (canceled_) {
            return false;
        }

        lock.unlock();
        emitStatus(generation, TransferStatus::Downloading, bytes);
        return true;
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return canceled_;
    }

    void finishExhaustedRange(Stream& stream) {
        if (stream.total && *stream.total != stream.offset) {
            throw TransferError(fmt::format("HTTP 416 at offset {} of {}", stream.offset,
                                            *stream.total));
        }
        spdlog::info("{} was already complete on disk", temp_path_.string());
        stream.bytes = stream.offset;
        complete(stream);
    }

    void complete(Stream& stream) {
        std::error_code ec;
        fs::rename(temp_path_, final_path_, ec);
        if (ec) {
            throw TransferError(fmt::format("Cannot rename {} to {}: {}", temp_path_.string(),
                                            final_path_.string(), ec.message()));
        }
        if (stream.total && *stream.total != stream.bytes) {
            spdlog::warn("{}: server announced {} bytes, received {}", url_, *stream.total,
                         stream.bytes);
        }
        emitProgress(stream.generation, stream.bytes, stream.bytes);
        finish(stream.generation, stream.bytes);
    }

    void cancelAttempt(Stream& stream) {
        stream.file.reset();
        spdlog::debug("{} canceled at {} bytes", url_, stream.bytes);
        markFinishing();
        emitProgress(stream.generation, stream.bytes, stream.total);
        emitStatus(stream.generation, TransferStatus::Canceled, stream.bytes);
    }

    void finish(std::uint64_t generation, std::uint64_t bytes) {
        markFinishing();
        TransferEvent event = makeEvent(generation, TransferEventKind::Finished);
        event.bytes = bytes;
        event.size = bytes;
        event.status = TransferStatus::Done;
        event.message = final_path_.string();
        events_.push(std::move(event));
    }

    void fail(std::uint64_t generation, const std::string& message) {
        spdlog::error("Transfer of {} failed: {}", url_, message);
        markFinishing();
        TransferEvent event = makeEvent(generation, TransferEventKind::Failed);
        event.status = TransferStatus::Error;
        event.message = message;
        events_.push(std::move(event));
    }

    void markFinishing() {
        std::lock_guard<std::mutex> lock(mutex_);
        finishing_ = true;
    }

    void emitProgress(std::uint64_t generation,
                      std::uint64_t bytes,
                      std::optional<std::uint64_t> total) {
        TransferEvent event = makeEvent(generation, TransferEventKind::Progress);
        event.bytes = bytes;
        event.size = total;
        events_.push(std::move(event));
    }

    void emitStatus(std::uint64_t generation, TransferStatus status, std::uint64_t bytes) {
        TransferEvent event = makeEvent(generation, TransferEventKind::Status);
        event.status = status;
        event.bytes = bytes;
        events_.push(std::move(event));
    }

    [[nodiscard]] TransferEvent makeEvent(std::uint64_t generation,
                                          TransferEventKind kind) const {
        TransferEvent event;
        event.task_id = id_;
        event.generation = generation;
        event.kind = kind;
        return event;
    }

    const std::uint64_t id_;
    const std::string url_;
    const fs::path final_path_;
    fs::path temp_path_;
    HttpClientPtr http_;
    EventChannel& events_;
    TaskOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::uint64_t generation_{0};
    bool active_{false};
    bool finishing_{false};
    bool paused_{false};
    bool canceled_{false};
    bool restart_requested_{false};
};

TransferTask::TransferTask(std::uint64_t id,
                           std::string url,
                           std::filesystem::path final_path,
                           HttpClientPtr http,
                           EventChannel& events,
                           TaskOptions options)
    : impl_(std::make_unique<Impl>(id, std::move(url), std::move(final_path), std::move(http),
                                   events, options)) {}

TransferTask::~TransferTask() = default;

std::uint64_t TransferTask::id() const { return impl_->id(); }

std::uint64_t TransferTask::run() { return impl_->run(); }

void TransferTask::requestPause() { impl_->requestPause(); }

void TransferTask::requestCancel() { impl_->requestCancel(); }

bool TransferTask::isActive() const { return impl_->isActive(); }

} // namespace partfetch
