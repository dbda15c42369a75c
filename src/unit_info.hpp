#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace svcdeck {

enum class UnitCategory {
    Service,
    Timer,
    Socket,
    Target,
    Path
};

inline constexpr std::array<UnitCategory, 5> kUnitCategories = {
    UnitCategory::Service,
    UnitCategory::Timer,
    UnitCategory::Socket,
    UnitCategory::Target,
    UnitCategory::Path,
};

// System-wide units vs the per-user manager (--user)
enum class Scope {
    System,
    User
};

const char* category_label(UnitCategory category);
const char* category_type_arg(UnitCategory category);
const std::vector<std::string>& status_options(UnitCategory category);
const char* scope_label(Scope scope);

// Snapshot of one unit as reported by list-units. Replaced wholesale on refresh.
struct Unit {
    std::string name;
    std::string load_state;
    std::string active_state;
    std::string sub_state;
    std::string description;

    // Category-specific extra column (timer next elapse, socket listen address)
    std::optional<std::string> detail;

    // Enablement state from list-unit-files ("enabled", "static", ...)
    std::optional<std::string> file_state;
};

extern const std::vector<std::string> kFileStateOptions;

// On-demand fact sheet from `systemctl show`. Zero-valued when unavailable.
struct UnitProperties {
    std::string fragment_path;
    std::string unit_file_state;
    std::string active_state;
    std::string active_enter_timestamp;
    std::string sub_state;
    std::string load_state;
    std::string description;
    uint32_t main_pid = 0;
    std::string exec_main_start_timestamp;
    std::optional<uint64_t> memory_current;
    std::optional<uint64_t> cpu_usage_nsec;

    // Dependency edges
    std::vector<std::string> requires_units;
    std::vector<std::string> wants;
    std::vector<std::string> after;
    std::vector<std::string> before;
    std::vector<std::string> conflicts;
    std::vector<std::string> triggered_by;
    std::vector<std::string> triggers;

    // Timer schedule
    std::vector<std::string> timers_calendar;
    std::vector<std::string> timers_monotonic;
    std::string last_trigger_usec;
    std::string result;
    std::string next_elapse_realtime;
    std::string persistent;
    std::string accuracy_usec;
    std::string randomized_delay_usec;

    // Path units
    std::string paths;

    // Socket units
    std::string listen;
    std::string accept;
    std::string n_connections;
    std::string n_accepted;
};

// One journal entry. Every field except the message may be missing.
struct LogRecord {
    std::optional<int64_t> timestamp_us;
    std::optional<int> priority;
    std::optional<std::string> pid;
    std::optional<std::string> identifier;
    std::string message;
    std::optional<std::string> boot_id;
    std::optional<std::string> invocation_id;
    std::optional<std::string> cursor;
};

inline constexpr int kMaxPriority = 7;

const char* priority_label(int priority);

enum class TimeRange {
    All,
    FifteenMinutes,
    OneHour,
    OneDay,
    SevenDays,
    Today
};

inline constexpr std::array<TimeRange, 6> kTimeRanges = {
    TimeRange::All,
    TimeRange::FifteenMinutes,
    TimeRange::OneHour,
    TimeRange::OneDay,
    TimeRange::SevenDays,
    TimeRange::Today,
};

const char* time_range_label(TimeRange range);

// Value for journalctl --since, nullptr for TimeRange::All
const char* time_range_since(TimeRange range);

enum class UnitAction {
    Start,
    Stop,
    Restart,
    Reload,
    Enable,
    Disable,
    DaemonReload
};

const char* action_label(UnitAction action);
const char* action_verb(UnitAction action);
const char* action_progress_label(UnitAction action);
std::string action_confirmation(UnitAction action, const std::string& unit_name);

// Host-wide actions run without a unit argument
bool is_host_wide(UnitAction action);

// Actions that make sense for a unit in the given state. DaemonReload is always last.
std::vector<UnitAction> available_actions(const std::string& sub_state,
                                                        const std::optional<std::string>& file_state);

} // namespace svcdeck
