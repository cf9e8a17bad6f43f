#pragma once

#include "config.hpp"

namespace partfetch {

// Installs the default spdlog logger: stderr at warn, or the --log-file sink at info.
// --verbose lowers either to debug. Throws spdlog::spdlog_ex if the file cannot be opened.
void initLogging(const Config& config);

} // namespace partfetch
