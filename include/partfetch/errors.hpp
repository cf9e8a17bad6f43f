#pragma once

#include <stdexcept>
#include <string>

namespace partfetch {

// Network or filesystem failure during one transfer attempt. Never escapes the task.
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The external extractor could not be started or exited unsuccessfully.
class ExtractionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace partfetch
