#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace flow_log {

// Shared "flowguard" logger. Created on first use with a stderr sink unless
// configure_logging() installed one before.
std::shared_ptr<spdlog::logger> logger();

// Replace the shared logger. An empty `log_file` logs to stderr; otherwise the
// file is truncated and written. Unknown level names fall back to info.
void configure_logging(const std::string& level, const std::string& log_file = "");

} // namespace flow_log
