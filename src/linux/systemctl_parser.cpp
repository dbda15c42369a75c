#include "systemctl_parser.hpp"
#include "../text_format.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <format>
#include <sstream>
#include <nlohmann/json.hpp>

namespace svcdeck {

using json = nlohmann::json;

namespace {

std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::optional<uint64_t> parse_u64(const std::string& value) {
    if (value.empty() || value == "[not set]" || value == "infinity") return std::nullopt;
    uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return std::nullopt;
    return result;
}

std::vector<std::string> split_words(const std::string& value) {
    std::vector<std::string> words;
    std::istringstream iss(value);
    std::string word;
    while (iss >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

// Array of objects, or nullopt when the text is not a JSON array
std::optional<json> parse_array(const std::string& json_text) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) return std::nullopt;
    return doc;
}

} // namespace

UnitParseResult parse_list_units(const std::string& json_text) {
    UnitParseResult result;

    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        result.error_message = "Failed to parse JSON from systemctl";
        return result;
    }
    if (!doc.is_array()) {
        result.error_message = "Unexpected JSON from systemctl: not an array";
        return result;
    }

    result.units.reserve(doc.size());
    for (const auto& entry : doc) {
        if (!entry.is_object()) continue;

        Unit unit;
        unit.name = string_field(entry, "unit");
        if (unit.name.empty()) continue;
        unit.load_state = string_field(entry, "load");
        unit.active_state = string_field(entry, "active");
        unit.sub_state = string_field(entry, "sub");
        unit.description = string_field(entry, "description");
        result.units.push_back(std::move(unit));
    }

    result.success = true;
    return result;
}

std::map<std::string, std::string> parse_timer_details(const std::string& json_text, uint64_t now_us) {
    std::map<std::string, std::string> details;
    auto doc = parse_array(json_text);
    if (!doc) return details;

    for (const auto& entry : *doc) {
        if (!entry.is_object()) continue;
        const std::string unit = string_field(entry, "unit");
        if (unit.empty()) continue;

        uint64_t next = 0;
        if (auto it = entry.find("next"); it != entry.end() && it->is_number_unsigned()) {
            next = it->get<uint64_t>();
        }
        details[unit] = next == 0 ? std::string("next: n/a")
                                  : std::format("next: {}", format_relative_time(next, now_us));
    }
    return details;
}

std::map<std::string, std::string> parse_socket_details(const std::string& json_text) {
    std::map<std::string, std::string> details;
    auto doc = parse_array(json_text);
    if (!doc) return details;

    for (const auto& entry : *doc) {
        if (!entry.is_object()) continue;
        const std::string unit = string_field(entry, "unit");
        if (unit.empty()) continue;
        details[unit] = string_field(entry, "listen");
    }
    return details;
}

std::map<std::string, std::string> parse_unit_file_states(const std::string& json_text) {
    std::map<std::string, std::string> states;
    auto doc = parse_array(json_text);
    if (!doc) return states;

    for (const auto& entry : *doc) {
        if (!entry.is_object()) continue;
        std::string file = string_field(entry, "unit_file");
        if (file.empty()) continue;

        // unit_file may be a full path
        if (auto slash = file.rfind('/'); slash != std::string::npos) {
            file = file.substr(slash + 1);
        }
        states[file] = string_field(entry, "state");
    }
    return states;
}

void merge_details(std::vector<Unit>& units, const std::map<std::string, std::string>& details) {
    for (auto& unit : units) {
        if (auto it = details.find(unit.name); it != details.end()) {
            unit.detail = it->second;
        }
    }
}

void merge_file_states(std::vector<Unit>& units, const std::map<std::string, std::string>& states) {
    for (auto& unit : units) {
        if (auto it = states.find(unit.name); it != states.end()) {
            unit.file_state = it->second;
        }
    }
}

std::vector<std::string> parse_timer_specs(const std::string& raw) {
    std::vector<std::string> specs;
    if (raw.empty()) return specs;

    size_t start = 0;
    while (start <= raw.size()) {
        size_t end = raw.find('}', start);
        if (end == std::string::npos) end = raw.size();

        std::string chunk = trim(raw.substr(start, end - start));
        while (!chunk.empty() && chunk.front() == '{') chunk.erase(0, 1);
        chunk = trim(chunk);

        if (!chunk.empty()) {
            std::string spec = trim(chunk.substr(0, chunk.find(';')));
            if (!spec.empty()) specs.push_back(std::move(spec));
        }
        start = end + 1;
    }
    return specs;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

UnitProperties parse_show_output(const std::string& text) {
    std::map<std::string, std::string> values;
    for (const auto& line : split_lines(text)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        values.emplace(line.substr(0, eq), line.substr(eq + 1));
    }

    auto get = [&values](const char* key) -> std::string {
        auto it = values.find(key);
        return it == values.end() ? std::string() : it->second;
    };

    UnitProperties props;
    props.fragment_path = get("FragmentPath");
    props.unit_file_state = get("UnitFileState");
    props.active_state = get("ActiveState");
    props.active_enter_timestamp = get("ActiveEnterTimestamp");
    props.sub_state = get("SubState");
    props.load_state = get("LoadState");
    props.description = get("Description");
    if (auto pid = parse_u64(get("MainPID")); pid && *pid <= UINT32_MAX) {
        props.main_pid = static_cast<uint32_t>(*pid);
    }
    props.exec_main_start_timestamp = get("ExecMainStartTimestamp");
    props.memory_current = parse_u64(get("MemoryCurrent"));
    props.cpu_usage_nsec = parse_u64(get("CPUUsageNSec"));

    props.requires_units = split_words(get("Requires"));
    props.wants = split_words(get("Wants"));
    props.after = split_words(get("After"));
    props.before = split_words(get("Before"));
    props.conflicts = split_words(get("Conflicts"));
    props.triggered_by = split_words(get("TriggeredBy"));
    props.triggers = split_words(get("Triggers"));

    props.timers_calendar = parse_timer_specs(get("TimersCalendar"));
    props.timers_monotonic = parse_timer_specs(get("TimersMonotonic"));
    props.last_trigger_usec = get("LastTriggerUSec");
    props.result = get("Result");
    props.next_elapse_realtime = get("NextElapseUSecRealtime");
    props.persistent = get("Persistent");
    props.accuracy_usec = get("AccuracyUSec");
    props.randomized_delay_usec = get("RandomizedDelayUSec");

    props.paths = get("Paths");

    props.listen = get("Listen");
    props.accept = get("Accept");
    props.n_connections = get("NConnections");
    props.n_accepted = get("NAccepted");
    return props;
}

} // namespace svcdeck
