#pragma once

#include "unit_info.hpp"
#include <chrono>
#include <cstddef>

namespace svcdeck {

// Session tunables. Defaults match the interactive program.
struct SessionConfig {
    size_t log_line_limit = 1000;
    std::chrono::milliseconds tail_interval{2000};
    std::chrono::milliseconds blink_interval{500};
    std::chrono::milliseconds action_poll_interval{50};
    std::chrono::milliseconds idle_wait{1000};
    Scope initial_scope = Scope::System;
    UnitCategory initial_category = UnitCategory::Service;
    bool live_tail = true;
};

} // namespace svcdeck
