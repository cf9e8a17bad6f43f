#pragma once

#include "http_client.hpp"

#include <string>

namespace partfetch {

struct HttpOptions {
    // Connect timeout and low-speed abort window. Must stay finite.
    long timeout_seconds{30};
    std::string user_agent{"partfetch/1.0 (libcurl)"};
};

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(HttpOptions options = {});

    [[nodiscard]] ProbeResult probe(const std::string& url) override;
    [[nodiscard]] FetchResult fetch(const FetchRequest& request,
                                    const HeadCallback& on_head,
                                    const DataCallback& on_data) override;

private:
    HttpOptions options_;
};

} // namespace partfetch
