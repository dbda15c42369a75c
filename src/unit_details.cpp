#include "unit_details.hpp"
#include "text_format.hpp"
#include <format>

namespace svcdeck {

namespace {

void add_field(std::vector<std::string>& lines, const char* label, const std::string& value) {
    if (value.empty()) return;
    lines.push_back(std::format("{:<18}{}", label, value));
}

void add_list(std::vector<std::string>& lines, const char* label, const std::vector<std::string>& values) {
    if (values.empty()) return;
    lines.push_back(std::format("{}:", label));
    for (const auto& value : values) {
        lines.push_back(std::format("  - {}", value));
    }
}

void add_section(std::vector<std::string>& lines, const char* title) {
    lines.emplace_back();
    lines.push_back(std::format("[{}]", title));
}

} // namespace

std::vector<std::string> format_unit_details(const std::string& unit_name,
                                             UnitCategory category,
                                             const UnitProperties& props) {
    std::vector<std::string> lines;

    add_field(lines, "Unit:", unit_name);
    add_field(lines, "Description:", props.description);

    std::string loaded = props.load_state;
    if (!props.fragment_path.empty()) {
        loaded += loaded.empty() ? props.fragment_path : std::format(" ({})", props.fragment_path);
    }
    add_field(lines, "Loaded:", loaded);
    add_field(lines, "Unit file:", props.unit_file_state);

    std::string active = props.active_state;
    if (!props.sub_state.empty()) active += std::format(" ({})", props.sub_state);
    if (!props.active_enter_timestamp.empty()) active += std::format(" since {}", props.active_enter_timestamp);
    add_field(lines, "Active:", active);

    if (props.main_pid != 0) {
        add_field(lines, "Main PID:", std::to_string(props.main_pid));
    }
    add_field(lines, "Started:", props.exec_main_start_timestamp);
    if (props.memory_current) {
        add_field(lines, "Memory:", format_bytes(*props.memory_current));
    }
    if (props.cpu_usage_nsec) {
        add_field(lines, "CPU:", format_cpu_time(*props.cpu_usage_nsec));
    }

    switch (category) {
        case UnitCategory::Timer:
            add_section(lines, "Timer");
            add_list(lines, "Calendar", props.timers_calendar);
            add_list(lines, "Monotonic", props.timers_monotonic);
            add_field(lines, "Next elapse:", props.next_elapse_realtime);
            add_field(lines, "Last trigger:", props.last_trigger_usec);
            add_field(lines, "Result:", props.result);
            add_field(lines, "Persistent:", props.persistent);
            add_field(lines, "Accuracy:", props.accuracy_usec);
            add_field(lines, "Randomized delay:", props.randomized_delay_usec);
            break;
        case UnitCategory::Socket:
            add_section(lines, "Socket");
            add_field(lines, "Listen:", props.listen);
            add_field(lines, "Accept:", props.accept);
            add_field(lines, "Connections:", props.n_connections);
            add_field(lines, "Accepted:", props.n_accepted);
            break;
        case UnitCategory::Path:
            add_section(lines, "Path");
            add_field(lines, "Paths:", props.paths);
            break;
        case UnitCategory::Service:
        case UnitCategory::Target:
            break;
    }

    const bool has_dependencies =
        !props.requires_units.empty() || !props.wants.empty() || !props.after.empty() ||
        !props.before.empty() || !props.conflicts.empty() || !props.triggered_by.empty() ||
        !props.triggers.empty();
    if (has_dependencies) {
        add_section(lines, "Dependencies");
        add_list(lines, "Requires", props.requires_units);
        add_list(lines, "Wants", props.wants);
        add_list(lines, "After", props.after);
        add_list(lines, "Before", props.before);
        add_list(lines, "Conflicts", props.conflicts);
        add_list(lines, "Triggered by", props.triggered_by);
        add_list(lines, "Triggers", props.triggers);
    }

    return lines;
}

StatusTone status_tone(const std::string& sub_state) {
    if (sub_state == "running" || sub_state == "listening" || sub_state == "active") return StatusTone::Good;
    if (sub_state == "exited" || sub_state == "elapsed") return StatusTone::Warning;
    if (sub_state == "dead" || sub_state == "stopped" || sub_state == "inactive") return StatusTone::Muted;
    if (sub_state == "failed") return StatusTone::Bad;
    if (sub_state == "waiting") return StatusTone::Waiting;
    return StatusTone::Neutral;
}

} // namespace svcdeck
