#include "unit_info.hpp"
#include <format>

namespace svcdeck {

const std::vector<std::string> kFileStateOptions = {
    "All", "enabled", "disabled", "static", "masked", "indirect"
};

const char* category_label(UnitCategory category) {
    switch (category) {
        case UnitCategory::Service: return "Services";
        case UnitCategory::Timer:   return "Timers";
        case UnitCategory::Socket:  return "Sockets";
        case UnitCategory::Target:  return "Targets";
        case UnitCategory::Path:    return "Paths";
    }
    return "Units";
}

const char* category_type_arg(UnitCategory category) {
    switch (category) {
        case UnitCategory::Service: return "service";
        case UnitCategory::Timer:   return "timer";
        case UnitCategory::Socket:  return "socket";
        case UnitCategory::Target:  return "target";
        case UnitCategory::Path:    return "path";
    }
    return "service";
}

const std::vector<std::string>& status_options(UnitCategory category) {
    static const std::vector<std::string> service = {"All", "running", "exited", "failed", "dead"};
    static const std::vector<std::string> timer = {"All", "waiting", "running", "elapsed"};
    static const std::vector<std::string> socket = {"All", "listening", "running", "failed"};
    static const std::vector<std::string> target = {"All", "active", "inactive"};
    static const std::vector<std::string> path = {"All", "waiting", "running", "failed"};

    switch (category) {
        case UnitCategory::Service: return service;
        case UnitCategory::Timer:   return timer;
        case UnitCategory::Socket:  return socket;
        case UnitCategory::Target:  return target;
        case UnitCategory::Path:    return path;
    }
    return service;
}

const char* scope_label(Scope scope) {
    return scope == Scope::User ? "User" : "System";
}

const char* priority_label(int priority) {
    static const char* labels[] = {
        "emerg", "alert", "crit", "err", "warning", "notice", "info", "debug"
    };
    if (priority < 0 || priority > kMaxPriority) return "unknown";
    return labels[priority];
}

const char* time_range_label(TimeRange range) {
    switch (range) {
        case TimeRange::All:            return "All";
        case TimeRange::FifteenMinutes: return "Last 15 minutes";
        case TimeRange::OneHour:        return "Last 1 hour";
        case TimeRange::OneDay:         return "Last 24 hours";
        case TimeRange::SevenDays:      return "Last 7 days";
        case TimeRange::Today:          return "Today";
    }
    return "All";
}

const char* time_range_since(TimeRange range) {
    switch (range) {
        case TimeRange::All:            return nullptr;
        case TimeRange::FifteenMinutes: return "15 min ago";
        case TimeRange::OneHour:        return "1 hour ago";
        case TimeRange::OneDay:         return "1 day ago";
        case TimeRange::SevenDays:      return "7 days ago";
        case TimeRange::Today:          return "today";
    }
    return nullptr;
}

const char* action_label(UnitAction action) {
    switch (action) {
        case UnitAction::Start:        return "Start";
        case UnitAction::Stop:         return "Stop";
        case UnitAction::Restart:      return "Restart";
        case UnitAction::Reload:       return "Reload";
        case UnitAction::Enable:       return "Enable";
        case UnitAction::Disable:      return "Disable";
        case UnitAction::DaemonReload: return "Daemon Reload";
    }
    return "?";
}

const char* action_verb(UnitAction action) {
    switch (action) {
        case UnitAction::Start:        return "start";
        case UnitAction::Stop:         return "stop";
        case UnitAction::Restart:      return "restart";
        case UnitAction::Reload:       return "reload";
        case UnitAction::Enable:       return "enable";
        case UnitAction::Disable:      return "disable";
        case UnitAction::DaemonReload: return "daemon-reload";
    }
    return "";
}

const char* action_progress_label(UnitAction action) {
    switch (action) {
        case UnitAction::Start:        return "Starting...";
        case UnitAction::Stop:         return "Stopping...";
        case UnitAction::Restart:      return "Restarting...";
        case UnitAction::Reload:       return "Reloading...";
        case UnitAction::Enable:       return "Enabling...";
        case UnitAction::Disable:      return "Disabling...";
        case UnitAction::DaemonReload: return "Reloading daemon...";
    }
    return "Working...";
}

std::string action_confirmation(UnitAction action, const std::string& unit_name) {
    if (action == UnitAction::DaemonReload) {
        return "Reload systemd daemon configuration?";
    }
    return std::format("{} {}?", action_label(action), unit_name);
}

bool is_host_wide(UnitAction action) {
    return action == UnitAction::DaemonReload;
}

std::vector<UnitAction> available_actions(const std::string& sub_state,
                                          const std::optional<std::string>& file_state) {
    std::vector<UnitAction> actions;

    if (sub_state == "running" || sub_state == "active" ||
        sub_state == "listening" || sub_state == "waiting") {
        actions.push_back(UnitAction::Stop);
        actions.push_back(UnitAction::Restart);
        actions.push_back(UnitAction::Reload);
    } else if (sub_state == "dead" || sub_state == "failed" ||
               sub_state == "inactive" || sub_state == "exited") {
        actions.push_back(UnitAction::Start);
    } else {
        actions.push_back(UnitAction::Start);
        actions.push_back(UnitAction::Stop);
    }

    if (file_state == "enabled") {
        actions.push_back(UnitAction::Disable);
    } else if (file_state == "disabled") {
        actions.push_back(UnitAction::Enable);
    }

    actions.push_back(UnitAction::DaemonReload);
    return actions;
}

} // namespace svcdeck
