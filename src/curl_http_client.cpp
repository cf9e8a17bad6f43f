#include "partfetch/curl_http_client.hpp"

#include "partfetch/detail/curl_utils.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace partfetch {

namespace {

struct ProbeHeaders {
    bool accepts_ranges{false};
};

struct FetchContext {
    CURL* curl{nullptr};
    const HttpClient::HeadCallback* on_head{nullptr};
    const HttpClient::DataCallback* on_data{nullptr};
    bool head_delivered{false};
    bool aborted{false};
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

size_t probeHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<ProbeHeaders*>(userdata);
    const size_t total = size * nitems;
    const std::string line = lowercase(std::string(buffer, total));

    // Each redirect hop starts a new header block; only the last one counts.
    if (line.rfind("http/", 0) == 0) {
        headers->accepts_ranges = false;
    } else if (line.rfind("accept-ranges:", 0) == 0) {
        headers->accepts_ranges = line.find("bytes") != std::string::npos;
    }
    return total;
}

std::optional<std::uint64_t> contentLength(CURL* curl) {
    curl_off_t length = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK ||
        length <= 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(length);
}

bool deliverHead(FetchContext& ctx) {
    if (ctx.head_delivered) {
        return true;
    }
    ctx.head_delivered = true;

    ResponseHead head;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &head.status_code);
    head.content_length = contentLength(ctx.curl);
    return (*ctx.on_head)(head);
}

size_t fetchWriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FetchContext*>(userdata);
    const size_t total = size * nmemb;
    if (!ctx || total == 0) {
        return 0;
    }

    if (!deliverHead(*ctx) || !(*ctx->on_data)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

} // namespace

CurlHttpClient::CurlHttpClient(HttpOptions options) : options_(std::move(options)) {
    detail::ensureCurlInitialized();
}

ProbeResult CurlHttpClient::probe(const std::string& url) {
    ProbeResult result;
    auto curl = detail::makeEasyHandle(url, options_);
    if (!curl) {
        result.error = "Failed to allocate curl handle";
        return result;
    }

    ProbeHeaders headers;
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, std::max(1L, options_.timeout_seconds));
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &probeHeaderCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.error = fmt::format("curl error: {}", curl_easy_strerror(res));
        return result;
    }

    long code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
    if (code >= 400) {
        result.error = fmt::format("HTTP {}", code);
        return result;
    }

    result.ok = true;
    result.content_length = contentLength(curl.get());
    result.accepts_ranges = headers.accepts_ranges;
    return result;
}

FetchResult CurlHttpClient::fetch(const FetchRequest& request,
                                  const HeadCallback& on_head,
                                  const DataCallback& on_data) {
    FetchResult result;
    auto curl = detail::makeEasyHandle(request.url, options_);
    if (!curl) {
        result.error = "Failed to allocate curl handle";
        return result;
    }

    FetchContext ctx{curl.get(), &on_head, &on_data};
    const std::string range = fmt::format("{}-", request.range_start);
    if (request.range_start > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &fetchWriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    const CURLcode res = curl_easy_perform(curl.get());

    if (ctx.aborted) {
        result.aborted = true;
        return result;
    }
    if (res != CURLE_OK) {
        result.error = error_buffer[0] != '\0'
                           ? fmt::format("curl error: {}", error_buffer)
                           : fmt::format("curl error: {}", curl_easy_strerror(res));
        return result;
    }

    // Empty bodies never reach the write callback.
    if (!deliverHead(ctx)) {
        result.aborted = true;
        return result;
    }
    result.ok = true;
    return result;
}

} // namespace partfetch
