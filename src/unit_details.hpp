#pragma once

#include "unit_info.hpp"
#include <string>
#include <vector>

namespace svcdeck {

// Human-readable property sheet for the details modal. Sections that do not
// apply to the category, and empty values, are left out.
std::vector<std::string> format_unit_details(const std::string& unit_name,
                                                           UnitCategory category,
                                                           const UnitProperties& props);

// Colour class for a sub-state string
enum class StatusTone {
    Good,
    Warning,
    Muted,
    Bad,
    Waiting,
    Neutral
};

StatusTone status_tone(const std::string& sub_state);

} // namespace svcdeck
