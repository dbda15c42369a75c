#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../text_format.hpp"
#include <algorithm>
#include <format>
#include <iterator>

namespace svcdeck {

void TuiApp::render_picker() {
    const Picker& picker = session_->modes().picker();

    int width = static_cast<int>(picker.title().size()) + 8;
    for (const auto& option : picker.options()) {
        width = std::max(width, static_cast<int>(option.size()) + 8);
    }
    int height = static_cast<int>(picker.options().size()) + 4;

    WINDOW* win = make_dialog(height, width, picker.title());
    if (!win) return;

    int rows = getmaxy(win) - 4;
    int first = std::max(0, static_cast<int>(picker.cursor()) - rows + 1);

    int row = 2;
    for (size_t i = static_cast<size_t>(first); i < picker.options().size() && row < getmaxy(win) - 2; ++i) {
        bool is_cursor = i == picker.cursor();
        if (is_cursor) wattron(win, COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD);
        mvwprintw(win, row, 2, "%s %s", is_cursor ? ">" : " ", picker.options()[i].c_str());
        if (is_cursor) wattroff(win, COLOR_PAIR(COLOR_PAIR_SELECTED) | A_BOLD);
        row++;
    }

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_confirm_dialog(Clock::time_point now) {
    const auto& actions = session_->actions();
    if (!actions.pending()) return;

    const PendingAction& pending = *actions.pending();
    std::string message;
    switch (actions.phase()) {
        case ActionPhase::Confirming:
            message = action_confirmation(pending.action, pending.unit_name);
            break;
        case ActionPhase::Executing:
            message = pending.unit_name.empty()
                ? std::string(action_progress_label(pending.action))
                : std::format("{} {}", action_progress_label(pending.action), pending.unit_name);
            break;
        case ActionPhase::Settled:
            message = actions.result() ? actions.result()->message : std::string();
            break;
        case ActionPhase::Idle:
            return;
    }

    int max_x = getmaxx(stdscr);
    int width = std::clamp(static_cast<int>(text_columns(message)) + 6, 44, std::max(44, max_x - 4));
    auto lines = wrap_text(message, width - 4);
    int height = static_cast<int>(lines.size()) + 6;

    std::string title = action_label(pending.action);
    WINDOW* win = make_dialog(height, width, title);
    if (!win) return;

    bool failed = actions.phase() == ActionPhase::Settled && actions.result() && !actions.result()->success;
    int row = 2;
    if (failed) wattron(win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
    for (const auto& line : lines) {
        if (row >= getmaxy(win) - 3) break;
        if (actions.phase() == ActionPhase::Executing && !session_->blink_on(now)) {
            row++;
            continue;
        }
        mvwprintw(win, row++, 2, "%s", line.c_str());
    }
    if (failed) wattroff(win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);

    int button_row = getmaxy(win) - 2;
    switch (actions.phase()) {
        case ActionPhase::Confirming:
            wattron(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
            mvwprintw(win, button_row, 6, " [Y] Confirm ");
            wattroff(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
            mvwprintw(win, button_row, 24, " [N] Cancel ");
            break;
        case ActionPhase::Executing:
            mvwprintw(win, button_row, 6, " [Esc] Hide ");
            break;
        default:
            wattron(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
            mvwprintw(win, button_row, 6, " Press any key ");
            wattroff(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
            break;
    }

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_text_modal(const std::string& title, const std::vector<std::string>& lines,
                               size_t scroll, bool is_error) {
    WINDOW* win = make_dialog(layout_.modal_height, layout_.modal_width, title);
    if (!win) return;

    int win_h, win_w;
    getmaxyx(win, win_h, win_w);
    int rows = win_h - 2;

    if (is_error) wattron(win, COLOR_PAIR(COLOR_PAIR_ERROR));
    int row = 1;
    for (size_t i = scroll; i < lines.size() && row <= rows; ++i) {
        mvwprintw(win, row++, 2, "%s", truncate_text(lines[i], win_w - 4).c_str());
    }
    if (is_error) wattroff(win, COLOR_PAIR(COLOR_PAIR_ERROR));

    // Position indicator
    if (static_cast<int>(lines.size()) > rows) {
        std::string pos = std::format(" {}/{} ", std::min(lines.size(), scroll + static_cast<size_t>(rows)),
                                      lines.size());
        mvwprintw(win, win_h - 1, std::max(1, win_w - static_cast<int>(pos.size()) - 2), "%s", pos.c_str());
    }

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_help_overlay() {
    // Help content
    const char* help_lines[] = {
        "Units:",
        "  Up/k, Down/j    Move selection up/down",
        "  PgUp, PgDn      Page up/down",
        "  Home/g, End/G   Jump to first/last",
        "  /               Search name and description",
        "  s / f           Filter by status / file state",
        "  t               Unit type",
        "  u               Toggle system/user units",
        "  i/Enter         Unit details",
        "  c               Show unit file",
        "  a               Actions (start, stop, ...)",
        "  r/F5            Reload unit list",
        "",
        "Logs:",
        "  l               Toggle log panel",
        "  j/k, PgUp/PgDn  Scroll",
        "  Ctrl-U/Ctrl-D   Half page up/down",
        "  g/G             Oldest / newest",
        "  / and n/N       Search, next/previous match",
        "  F               Toggle live tail",
        "  p / T           Severity / time range",
        "",
        "  Esc             Clear search / close",
        "  q               Quit",
        "  ?/F1            This help"
    };

    int help_width = 60;
    int help_height = static_cast<int>(std::size(help_lines)) + 5;
    WINDOW* help_win = make_dialog(help_height, help_width, "Help");
    if (!help_win) return;

    int row = 2;
    int last_row = getmaxy(help_win) - 3;
    for (const char* line : help_lines) {
        if (row > last_row) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            std::string key(line, 2, 16);
            std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", desc.c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    // Close instruction
    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(help_win, getmaxy(help_win) - 2, (getmaxx(help_win) - 24) / 2, " Press any key to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wrefresh(help_win);
    delwin(help_win);
}

} // namespace svcdeck
