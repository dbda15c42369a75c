#include "journal_parser.hpp"
#include <charconv>
#include <optional>
#include <nlohmann/json.hpp>

namespace svcdeck {

using json = nlohmann::json;

namespace {

std::optional<std::string> optional_string(const json& entry, const char* key) {
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

template <typename T>
std::optional<T> optional_number(const json& entry, const char* key) {
    auto text = optional_string(entry, key);
    if (!text || text->empty()) return std::nullopt;

    T value{};
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) return std::nullopt;
    return value;
}

// Journal fields that are not valid UTF-8 arrive as byte arrays
std::string bytes_to_string(const json& array) {
    std::string out;
    out.reserve(array.size());
    for (const auto& b : array) {
        if (b.is_number_unsigned()) {
            out.push_back(static_cast<char>(b.get<uint64_t>() & 0xFF));
        }
    }
    return out;
}

// Replaces invalid UTF-8 sequences with U+FFFD
std::string sanitize_utf8(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        const auto c = static_cast<unsigned char>(in[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c >> 5) == 0x6) len = 2;
        else if ((c >> 4) == 0xE) len = 3;
        else if ((c >> 3) == 0x1E) len = 4;

        bool valid = len > 0 && i + len <= in.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(in[i + k]) >> 6) == 0x2;
        }

        if (valid) {
            out.append(in, i, len);
            i += len;
        } else {
            out += "\xEF\xBF\xBD";
            ++i;
        }
    }
    return out;
}

} // namespace

LogRecord parse_journal_line(const std::string& line) {
    LogRecord record;

    json entry = json::parse(line, nullptr, false);
    if (entry.is_discarded() || !entry.is_object()) {
        record.message = line;
        return record;
    }

    auto message = entry.find("MESSAGE");
    if (message != entry.end() && message->is_string()) {
        record.message = message->get<std::string>();
    } else if (message != entry.end() && message->is_array()) {
        record.message = sanitize_utf8(bytes_to_string(*message));
    } else {
        record.message = line;
    }

    record.priority = optional_number<int>(entry, "PRIORITY");
    record.timestamp_us = optional_number<int64_t>(entry, "__REALTIME_TIMESTAMP");
    record.pid = optional_string(entry, "_PID");
    record.identifier = optional_string(entry, "SYSLOG_IDENTIFIER");
    record.boot_id = optional_string(entry, "_BOOT_ID");
    record.invocation_id = optional_string(entry, "_SYSTEMD_INVOCATION_ID");
    record.cursor = optional_string(entry, "__CURSOR");
    return record;
}

std::vector<LogRecord> parse_journal_output(const std::string& text) {
    std::vector<LogRecord> records;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();

        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) {
            records.push_back(parse_journal_line(line));
        }
        start = end + 1;
    }
    return records;
}

} // namespace svcdeck
