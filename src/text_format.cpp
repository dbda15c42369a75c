#include "text_format.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>

namespace svcdeck {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains_lower(const std::string& haystack, const std::string& needle_lower) {
    if (needle_lower.empty()) return true;
    return to_lower(haystack).find(needle_lower) != std::string::npos;
}

std::string format_bytes(uint64_t bytes) {
    constexpr uint64_t kb = 1024;
    constexpr uint64_t mb = 1024 * kb;
    constexpr uint64_t gb = 1024 * mb;

    if (bytes >= gb) return std::format("{:.1f} GB", static_cast<double>(bytes) / gb);
    if (bytes >= mb) return std::format("{:.1f} MB", static_cast<double>(bytes) / mb);
    if (bytes >= kb) return std::format("{:.1f} KB", static_cast<double>(bytes) / kb);
    return std::format("{} B", bytes);
}

std::string format_cpu_time(uint64_t nsec) {
    const double secs = static_cast<double>(nsec) / 1'000'000'000.0;
    if (secs >= 60.0) {
        return std::format("{:.1f}min", secs / 60.0);
    }
    return std::format("{:.3f}s", secs);
}

std::string format_log_timestamp(int64_t timestamp_us) {
    const std::time_t secs = static_cast<std::time_t>(timestamp_us / 1'000'000);
    std::tm tm_val{};
    if (!localtime_r(&secs, &tm_val)) return {};
    char buf[32];
    std::strftime(buf, sizeof(buf), "%b %d %H:%M:%S", &tm_val);
    return buf;
}

std::string format_relative_time(uint64_t target_us, uint64_t now_us) {
    if (target_us <= now_us) return "elapsed";

    const uint64_t diff_secs = (target_us - now_us) / 1'000'000;
    const uint64_t days = diff_secs / 86400;
    const uint64_t hours = (diff_secs % 86400) / 3600;
    const uint64_t minutes = (diff_secs % 3600) / 60;
    const uint64_t seconds = diff_secs % 60;

    if (days > 0) return std::format("{}d {}h", days, hours);
    if (hours > 0) return std::format("{}h {}m", hours, minutes);
    if (minutes > 0) return std::format("{}m {}s", minutes, seconds);
    return std::format("{}s", seconds);
}

uint64_t realtime_now_us() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

std::string format_log_line(const LogRecord& record) {
    std::string line;
    if (record.timestamp_us) {
        line += format_log_timestamp(*record.timestamp_us);
        line += ' ';
    }
    if (record.identifier) {
        line += *record.identifier;
        if (record.pid) {
            line += std::format("[{}]", *record.pid);
        }
        line += ": ";
    }
    line += record.message;
    return line;
}

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte offset just past the next `columns` code points of text, starting at pos
size_t advance_columns(const std::string& text, size_t pos, size_t end, size_t columns) {
    while (pos < end && columns > 0) {
        ++pos;
        while (pos < end && is_continuation(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        --columns;
    }
    return pos;
}

size_t columns_between(const std::string& text, size_t begin, size_t end) {
    size_t columns = 0;
    for (size_t i = begin; i < end; ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[i]))) ++columns;
    }
    return columns;
}

} // namespace

size_t text_columns(const std::string& text) {
    return columns_between(text, 0, text.size());
}

std::string truncate_text(const std::string& text, int width) {
    if (width <= 0) return {};
    const size_t w = static_cast<size_t>(width);
    if (text_columns(text) <= w) return text;
    if (w <= 3) return text.substr(0, advance_columns(text, 0, text.size(), w));
    return text.substr(0, advance_columns(text, 0, text.size(), w - 3)) + "...";
}

std::vector<std::string> wrap_text(const std::string& text, int width) {
    std::vector<std::string> lines;
    const size_t w = width > 0 ? static_cast<size_t>(width) : 1;

    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        const size_t end = nl == std::string::npos ? text.size() : nl;

        if (start == end) {
            lines.emplace_back();
        } else {
            for (size_t pos = start; pos < end;) {
                size_t next = advance_columns(text, pos, end, w);
                lines.push_back(text.substr(pos, next - pos));
                pos = next;
            }
        }

        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

int wrapped_line_count(const std::string& text, int width) {
    const size_t w = width > 0 ? static_cast<size_t>(width) : 1;
    int count = 0;

    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        size_t len = columns_between(text, start, nl == std::string::npos ? text.size() : nl);
        count += len == 0 ? 1 : static_cast<int>((len + w - 1) / w);

        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return count;
}

} // namespace svcdeck
