#include "tui_colors.hpp"
#include "../unit_details.hpp"

namespace svcdeck {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    // Basic colors
    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_HEADER, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_BORDER, COLOR_BLUE, -1);

    // Status
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);
    init_pair(COLOR_PAIR_WARNING, COLOR_YELLOW, -1);

    // Unit sub-states
    init_pair(COLOR_PAIR_UNIT_GOOD, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_UNIT_WARNING, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_UNIT_MUTED, COLOR_BLUE, -1);
    init_pair(COLOR_PAIR_UNIT_BAD, COLOR_RED, -1);
    init_pair(COLOR_PAIR_UNIT_WAITING, COLOR_CYAN, -1);

    // Journal priorities
    init_pair(COLOR_PAIR_LOG_ERROR, COLOR_RED, -1);
    init_pair(COLOR_PAIR_LOG_WARNING, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_LOG_NOTICE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_LOG_DEBUG, COLOR_BLUE, -1);
    init_pair(COLOR_PAIR_MARKER, COLOR_MAGENTA, -1);

    // Search and highlight
    init_pair(COLOR_PAIR_SEARCH, COLOR_BLACK, COLOR_YELLOW);
    init_pair(COLOR_PAIR_HIGHLIGHT, COLOR_BLACK, COLOR_GREEN);

    // Dialog
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_DIALOG_BUTTON, COLOR_BLACK, COLOR_WHITE);

    // Help
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, -1);
}

int get_status_color(const std::string& sub_state) {
    switch (status_tone(sub_state)) {
        case StatusTone::Good:
            return COLOR_PAIR_UNIT_GOOD;
        case StatusTone::Warning:
            return COLOR_PAIR_UNIT_WARNING;
        case StatusTone::Muted:
            return COLOR_PAIR_UNIT_MUTED;
        case StatusTone::Bad:
            return COLOR_PAIR_UNIT_BAD;
        case StatusTone::Waiting:
            return COLOR_PAIR_UNIT_WAITING;
        case StatusTone::Neutral:
            return COLOR_PAIR_DEFAULT;
    }
    return COLOR_PAIR_DEFAULT;
}

int get_priority_color(std::optional<int> priority) {
    if (!priority) return COLOR_PAIR_DEFAULT;
    switch (*priority) {
        case 0:
        case 1:
        case 2:
        case 3:
            return COLOR_PAIR_LOG_ERROR;
        case 4:
            return COLOR_PAIR_LOG_WARNING;
        case 5:
            return COLOR_PAIR_LOG_NOTICE;
        case 7:
            return COLOR_PAIR_LOG_DEBUG;
        default:
            return COLOR_PAIR_DEFAULT;
    }
}

} // namespace svcdeck
