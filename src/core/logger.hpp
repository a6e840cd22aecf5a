#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace conclave::core {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace".."off"; unknown names fall back to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace conclave::core
