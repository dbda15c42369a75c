#pragma once

#include "unit_info.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace svcdeck {

std::string to_lower(const std::string& s);

// Case-insensitive substring test. needle_lower must already be lowercase.
bool contains_lower(const std::string& haystack, const std::string& needle_lower);

// "512 B", "1.5 KB", "2.0 MB", "1.1 GB"
std::string format_bytes(uint64_t bytes);

// "0.500s" below a minute, "1.5min" above
std::string format_cpu_time(uint64_t nsec);

// Local time as "Mon DD HH:MM:SS"
std::string format_log_timestamp(int64_t timestamp_us);

// Distance from now_us to target_us: "2d 3h", "1h 5m", "4m 2s", "9s" or "elapsed"
std::string format_relative_time(uint64_t target_us, uint64_t now_us);
uint64_t realtime_now_us();

// "Mon DD HH:MM:SS identifier[pid]: message"; missing fields are left out
std::string format_log_line(const LogRecord& record);

// Terminal columns of UTF-8 text, one per code point
size_t text_columns(const std::string& text);

// Cuts text to width columns on a code point boundary, ending in "..." when cut
std::string truncate_text(const std::string& text, int width);

// Hard-wraps text at width columns. Embedded newlines start a new line.
// Always returns at least one (possibly empty) line; never splits a code point.
std::vector<std::string> wrap_text(const std::string& text, int width);
int wrapped_line_count(const std::string& text, int width);

} // namespace svcdeck
