#ifndef GCM_TUI_LOGGING_H
#define GCM_TUI_LOGGING_H

#include <spdlog/common.h>
#include <filesystem>
#include <string>

namespace gcm {

// Route the default spdlog logger to <dir>/gcm-tui.log. The terminal
// belongs to the UI, so nothing is logged to stdout/stderr while it runs.
// Level comes from $GCM_LOG_LEVEL (default "info").
// Throws std::runtime_error when the log file cannot be opened.
void initLogging(const std::filesystem::path& dir);

// Maps "trace".."off" to a spdlog level; unknown names give info
spdlog::level::level_enum parseLogLevel(const std::string& name);

}  // namespace gcm

#endif  // GCM_TUI_LOGGING_H
