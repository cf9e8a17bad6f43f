#pragma once

#include "partfetch/http_client.hpp"
#include "partfetch/scheduler.hpp"
#include "partfetch/transfer_event.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace partfetch::test {

namespace fs = std::filesystem;

// Deterministic pseudo-random payload so checksums differ between offsets.
inline std::string makeBody(std::size_t size, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::string body(size, '\0');
    for (auto& c : body) {
        c = static_cast<char>(rng() & 0xff);
    }
    return body;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeFile(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("partfetch-test-" + std::to_string(rd()) + "-" + std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// In-memory HTTP server. Gated resources stop delivering at `gate_at` until openGate().
class FakeHttpClient final : public HttpClient {
public:
    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    struct Resource {
        std::string body;
        bool honor_ranges{true};
        bool probe_fails{false};
        bool hide_length{false};
        std::optional<std::uint64_t> reported_size;
        long status{200};
        // Connection drops after this many body bytes, once.
        std::size_t fail_after{npos};
        std::size_t piece{1024};
        bool gated{false};
        std::size_t gate_at{0};
        // Client gives up after the head without any callback asking it to.
        bool abort_after_head{false};
    };

    void serve(const std::string& url, Resource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    void openGate(const std::string& url) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            opened_[url] = true;
        }
        cv_.notify_all();
    }

    void openAll() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            all_open_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] std::vector<FetchRequest> fetches(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<FetchRequest> out;
        std::copy_if(fetches_.begin(), fetches_.end(), std::back_inserter(out),
                     [&url](const FetchRequest& r) { return r.url == url; });
        return out;
    }

    [[nodiscard]] int probeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return probes_;
    }

    // Blocks until some fetch of `url` is parked at its gate.
    bool waitUntilParked(const std::string& url,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return parked_.count(url) > 0; });
    }

    // Blocks until `count` fetches of `url` have returned to the caller.
    bool waitUntilReturned(const std::string& url, int count = 1,
                           std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return returned_[url] >= count; });
    }

    ProbeResult probe(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++probes_;
        ProbeResult result;
        const auto it = resources_.find(url);
        if (it == resources_.end()) {
            result.error = "Could not resolve host";
            return result;
        }
        const Resource& res = it->second;
        if (res.probe_fails || res.status >= 400) {
            result.error = "HEAD rejected";
            return result;
        }
        result.ok = true;
        result.accepts_ranges = res.honor_ranges;
        if (!res.hide_length) {
            result.content_length = res.reported_size.value_or(res.body.size());
        }
        return result;
    }

    FetchResult fetch(const FetchRequest& request,
                      const HeadCallback& on_head,
                      const DataCallback& on_data) override {
        FetchResult result;
        ReturnSignal signal{this, request.url};
        Resource res;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fetches_.push_back(request);
            const auto it = resources_.find(request.url);
            if (it == resources_.end()) {
                result.error = "Could not resolve host";
                return result;
            }
            res = it->second;
            // Failures are one-shot so a later attempt can succeed.
            it->second.fail_after = npos;
        }

        long status = res.status;
        std::size_t pos = 0;
        if (status < 400 && request.range_start > 0 && res.honor_ranges) {
            if (request.range_start >= res.body.size()) {
                status = 416;
            } else {
                pos = static_cast<std::size_t>(request.range_start);
                status = 206;
            }
        }

        ResponseHead head;
        head.status_code = status;
        if (!res.hide_length && status < 400) {
            head.content_length = res.body.size() - pos;
        }
        if (!on_head(head)) {
            result.aborted = true;
            return result;
        }
        if (status >= 400) {
            result.ok = true;
            return result;
        }
        if (res.abort_after_head) {
            result.aborted = true;
            return result;
        }

        std::size_t delivered = 0;
        while (pos < res.body.size()) {
            if (res.gated && pos >= res.gate_at) {
                waitAtGate(request.url);
            }
            if (delivered >= res.fail_after) {
                result.error = "Connection reset by peer";
                return result;
            }
            std::size_t n = std::min(res.piece, res.body.size() - pos);
            if (res.gated && pos < res.gate_at) {
                n = std::min(n, res.gate_at - pos);
            }
            if (res.fail_after != npos) {
                n = std::min(n, res.fail_after - delivered);
            }
            if (!on_data(res.body.data() + pos, n)) {
                result.aborted = true;
                return result;
            }
            pos += n;
            delivered += n;
        }
        result.ok = true;
        return result;
    }

private:
    struct ReturnSignal {
        FakeHttpClient* self;
        std::string url;
        ~ReturnSignal() {
            {
                std::lock_guard<std::mutex> lock(self->mutex_);
                ++self->returned_[url];
            }
            self->cv_.notify_all();
        }
    };

    void waitAtGate(const std::string& url) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (all_open_ || opened_[url]) {
            return;
        }
        parked_[url] = true;
        cv_.notify_all();
        cv_.wait(lock, [&] { return all_open_ || opened_[url]; });
        parked_.erase(url);
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Resource> resources_;
    std::map<std::string, bool> opened_;
    std::map<std::string, bool> parked_;
    std::map<std::string, int> returned_;
    std::vector<FetchRequest> fetches_;
    int probes_{0};
    bool all_open_{false};
};

// Collects events from a channel until `done` accepts one of them.
inline bool collectUntil(EventChannel& channel,
                         std::vector<TransferEvent>& seen,
                         const std::function<bool(const TransferEvent&)>& done,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        channel.waitFor(std::chrono::milliseconds(20));
        for (auto& event : channel.drain()) {
            seen.push_back(event);
            if (done(event)) {
                return true;
            }
        }
    }
    return false;
}

inline bool isFinal(const TransferEvent& event) {
    return event.kind == TransferEventKind::Finished || event.kind == TransferEventKind::Failed ||
           (event.kind == TransferEventKind::Status &&
            event.status == TransferStatus::Canceled);
}

inline bool pumpUntil(Scheduler& scheduler,
                      const std::function<bool(const std::vector<TransferItem>&)>& done,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        scheduler.waitAndProcess(std::chrono::milliseconds(20));
        if (done(scheduler.snapshot())) {
            return true;
        }
    }
    return false;
}

inline std::vector<TransferStatus> statuses(const std::vector<TransferItem>& items) {
    std::vector<TransferStatus> out;
    for (const auto& item : items) {
        out.push_back(item.status);
    }
    return out;
}

} // namespace partfetch::test
