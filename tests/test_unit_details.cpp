#include "doctest.h"

#include "unit_details.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace svcdeck;

namespace {

bool has_line(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

} // namespace

TEST_CASE("format_unit_details lists the populated service fields") {
    UnitProperties props;
    props.description = "OpenBSD Secure Shell server";
    props.load_state = "loaded";
    props.fragment_path = "/usr/lib/systemd/system/ssh.service";
    props.active_state = "active";
    props.sub_state = "running";
    props.main_pid = 812;
    props.memory_current = 5ull * 1024 * 1024;

    auto lines = format_unit_details("ssh.service", UnitCategory::Service, props);
    REQUIRE_FALSE(lines.empty());
    CHECK(lines[0] == "Unit:             ssh.service");
    CHECK(has_line(lines, "Loaded:           loaded (/usr/lib/systemd/system/ssh.service)"));
    CHECK(has_line(lines, "Active:           active (running)"));
    CHECK(has_line(lines, "Main PID:         812"));
    CHECK(has_line(lines, "Memory:           5.0 MB"));

    // Unset fields are left out
    CHECK_FALSE(has_line(lines, "[Dependencies]"));
    CHECK(std::none_of(lines.begin(), lines.end(),
                       [](const std::string& l) { return l.starts_with("CPU:"); }));
}

TEST_CASE("format_unit_details adds category and dependency sections") {
    UnitProperties props;
    props.timers_calendar = {"OnCalendar=daily"};
    props.triggers = {"logrotate.service"};

    auto lines = format_unit_details("logrotate.timer", UnitCategory::Timer, props);
    CHECK(has_line(lines, "[Timer]"));
    CHECK(has_line(lines, "Calendar:"));
    CHECK(has_line(lines, "  - OnCalendar=daily"));
    CHECK(has_line(lines, "[Dependencies]"));
    CHECK(has_line(lines, "Triggers:"));
    CHECK(has_line(lines, "  - logrotate.service"));
}

TEST_CASE("status_tone groups sub-states") {
    CHECK(status_tone("running") == StatusTone::Good);
    CHECK(status_tone("listening") == StatusTone::Good);
    CHECK(status_tone("exited") == StatusTone::Warning);
    CHECK(status_tone("dead") == StatusTone::Muted);
    CHECK(status_tone("failed") == StatusTone::Bad);
    CHECK(status_tone("waiting") == StatusTone::Waiting);
    CHECK(status_tone("auto-restart") == StatusTone::Neutral);
}
