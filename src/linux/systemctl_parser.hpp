#pragma once

#include "../unit_info.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace svcdeck {

struct UnitParseResult {
    bool success = false;
    std::vector<Unit> units;
    std::string error_message;
};

// `systemctl list-units --output=json`: array of {unit, load, active, sub, description}
UnitParseResult parse_list_units(const std::string& json_text);

// `systemctl list-timers --output=json`, keyed by timer unit: "next: <relative>" or "next: n/a"
std::map<std::string, std::string> parse_timer_details(const std::string& json_text, uint64_t now_us);

// `systemctl list-sockets --output=json`, keyed by socket unit: the listen address
std::map<std::string, std::string> parse_socket_details(const std::string& json_text);

// `systemctl list-unit-files --output=json`, keyed by file basename: the enablement state
std::map<std::string, std::string> parse_unit_file_states(const std::string& json_text);

// Fills unit.detail / unit.file_state from the maps above; units without an entry are left alone
void merge_details(std::vector<Unit>& units, const std::map<std::string, std::string>& details);
void merge_file_states(std::vector<Unit>& units, const std::map<std::string, std::string>& states);

// `systemctl show` key=value output
UnitProperties parse_show_output(const std::string& text);

// "{ OnCalendar=daily ; next_elapse=... }" chunks -> ["OnCalendar=daily"]
std::vector<std::string> parse_timer_specs(const std::string& raw);

std::vector<std::string> split_lines(const std::string& text);

} // namespace svcdeck
