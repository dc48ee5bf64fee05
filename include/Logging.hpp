#pragma once

#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcpdb {

// Level for a LOG_LEVEL value; unknown names map to info
spdlog::level::level_enum parseLogLevel(const std::string& name);

// Install the default logger: coloured stderr plus a rotating file.
// stdout is left to protocol traffic. A file that cannot be opened is
// skipped with a warning on stderr.
void setupLogging(const LoggingConfig& config);

}  // namespace mcpdb
