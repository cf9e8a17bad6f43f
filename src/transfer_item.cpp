#include "partfetch/transfer_item.hpp"

#include <cctype>
#include <utility>

namespace partfetch {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::string percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            const int hi = hexValue(in[i + 1]);
            const int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

std::string urlPath(const std::string& url) {
    std::size_t start = 0;
    const auto scheme = url.find("://");
    if (scheme != std::string::npos) {
        start = url.find('/', scheme + 3);
        if (start == std::string::npos) {
            return {};
        }
    }
    const auto end = url.find_first_of("?#", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

} // namespace

const char* statusName(TransferStatus status) noexcept {
    switch (status) {
    case TransferStatus::Queued:
        return "Queued";
    case TransferStatus::Downloading:
        return "Downloading";
    case TransferStatus::Paused:
        return "Paused";
    case TransferStatus::Done:
        return "Done";
    case TransferStatus::Error:
        return "Error";
    case TransferStatus::Canceled:
        return "Canceled";
    }
    return "Unknown";
}

bool isTerminal(TransferStatus status) noexcept {
    return status == TransferStatus::Done || status == TransferStatus::Error ||
           status == TransferStatus::Canceled;
}

bool canTransition(TransferStatus from, TransferStatus to) noexcept {
    using S = TransferStatus;
    switch (from) {
    case S::Queued:
        return to == S::Downloading;
    case S::Downloading:
        return to == S::Done || to == S::Error || to == S::Canceled || to == S::Paused;
    case S::Paused:
        return to == S::Downloading || to == S::Canceled;
    case S::Error:
    case S::Canceled:
        return to == S::Downloading || to == S::Queued;
    case S::Done:
        return to == S::Queued;
    }
    return false;
}

std::string filenameFromUrl(const std::string& url) {
    const std::string path = urlPath(url);
    const auto slash = path.find_last_of('/');
    const std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);

    std::string name = percentDecode(segment);
    for (char& c : name) {
        if (c == '/' || c == '\\' || std::iscntrl(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    if (name.empty() || name == "." || name == "..") {
        return kFallbackFilename;
    }
    return name;
}

TransferItem::TransferItem(std::size_t index, std::string url, std::filesystem::path dest_dir)
    : index(index), url(std::move(url)), dest_dir(std::move(dest_dir)) {}

const std::string& TransferItem::resolveFilename() {
    if (filename.empty()) {
        filename = filenameFromUrl(url);
    }
    return filename;
}

std::filesystem::path TransferItem::finalPath() const {
    return dest_dir / (filename.empty() ? filenameFromUrl(url) : filename);
}

std::filesystem::path TransferItem::tempPath() const {
    std::filesystem::path temp = finalPath();
    temp += kTempSuffix;
    return temp;
}

} // namespace partfetch
