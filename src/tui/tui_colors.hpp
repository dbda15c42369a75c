#pragma once

#include <ncurses.h>
#include <optional>
#include <string>

namespace svcdeck {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_WARNING,
    COLOR_PAIR_UNIT_GOOD,
    COLOR_PAIR_UNIT_WARNING,
    COLOR_PAIR_UNIT_MUTED,
    COLOR_PAIR_UNIT_BAD,
    COLOR_PAIR_UNIT_WAITING,
    COLOR_PAIR_LOG_ERROR,
    COLOR_PAIR_LOG_WARNING,
    COLOR_PAIR_LOG_NOTICE,
    COLOR_PAIR_LOG_DEBUG,
    COLOR_PAIR_MARKER,
    COLOR_PAIR_SEARCH,
    COLOR_PAIR_HIGHLIGHT,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_BUTTON,
    COLOR_PAIR_HELP_KEY,
};

// Initialize ncurses color pairs
void init_colors();

// Get color pair for a unit sub-state
int get_status_color(const std::string& sub_state);

// Get color pair for a journal priority
int get_priority_color(std::optional<int> priority);

} // namespace svcdeck
