#pragma once

#include <string>

namespace svcdeck {

// Candidate log file locations, most preferred first
std::string default_log_path();

// Installs a file logger as spdlog's default so nothing is written to the
// terminal while curses owns it. Falls back to /tmp, then to a disabled logger.
void init_logging();

// Replaces the file logger with one that has no sinks, then flushes the file.
// Threads still finishing may keep logging after this.
void shutdown_logging();

} // namespace svcdeck
