#pragma once

#include <memory>
#include <string>

#include <curl/curl.h>

namespace partfetch {
struct HttpOptions;
}

namespace partfetch::detail {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensureCurlInitialized();

// Easy handle with the options every request shares: redirects, timeouts, user agent.
// Returns an empty handle if libcurl cannot allocate one.
CurlHandle makeEasyHandle(const std::string& url, const HttpOptions& options);

} // namespace partfetch::detail
