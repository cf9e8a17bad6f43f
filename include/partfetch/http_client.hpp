#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace partfetch {

struct ProbeResult {
    bool ok{false};
    std::optional<std::uint64_t> content_length;
    bool accepts_ranges{false};
    std::string error;
};

struct FetchRequest {
    std::string url;
    // Non-zero sends "Range: bytes=<range_start>-".
    std::uint64_t range_start{0};
};

struct ResponseHead {
    long status_code{0};
    std::optional<std::uint64_t> content_length;
};

struct FetchResult {
    bool ok{false};
    // A callback returned false and the transfer was stopped on our side.
    bool aborted{false};
    std::string error;
};

// HTTP capability consumed by TransferTask. Implementations must be safe to call from
// several task threads at once.
class HttpClient {
public:
    using HeadCallback = std::function<bool(const ResponseHead&)>;
    using DataCallback = std::function<bool(const char*, std::size_t)>;

    virtual ~HttpClient() = default;

    // Header-only request: size and range support.
    [[nodiscard]] virtual ProbeResult probe(const std::string& url) = 0;

    // Streaming GET. on_head runs once per received response, before any on_data call,
    // also when the body is empty. Returning false from either callback aborts the fetch.
    [[nodiscard]] virtual FetchResult fetch(const FetchRequest& request,
                                            const HeadCallback& on_head,
                                            const DataCallback& on_data) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

} // namespace partfetch
