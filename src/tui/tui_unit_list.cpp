#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../text_format.hpp"
#include <algorithm>
#include <format>

namespace svcdeck {

void TuiApp::render_header() {
    int max_x = getmaxx(header_win_);
    const auto& units = session_->units();

    wattron(header_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    mvwprintw(header_win_, 0, 1, "svcdeck");
    wattroff(header_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);

    std::string info = std::format("  {} | {} | {}/{} units",
                                   scope_label(units.scope()), category_label(units.category()),
                                   units.filtered_indices().size(), units.units().size());
    if (units.sub_state_filter()) info += " | status: " + *units.sub_state_filter();
    if (units.file_state_filter()) info += " | file: " + *units.file_state_filter();
    if (!units.search_query().empty()) info += " | search: " + units.search_query();

    wattron(header_win_, COLOR_PAIR(COLOR_PAIR_HEADER));
    mvwprintw(header_win_, 0, 8, "%s", truncate_text(info, max_x - 9).c_str());
    wattroff(header_win_, COLOR_PAIR(COLOR_PAIR_HEADER));
}

void TuiApp::render_unit_list() {
    if (!unit_win_) return;

    int max_y, max_x;
    getmaxyx(unit_win_, max_y, max_x);

    const auto& units = session_->units();
    std::string title = std::format("{} Units", category_label(units.category()));
    draw_box_title(unit_win_, session_->log_focus() ? title : "[" + title + "]");

    if (units.fetch_error()) {
        wattron(unit_win_, COLOR_PAIR(COLOR_PAIR_ERROR));
        mvwprintw(unit_win_, 2, 2, "%s", truncate_text("Error: " + *units.fetch_error(), max_x - 4).c_str());
        wattroff(unit_win_, COLOR_PAIR(COLOR_PAIR_ERROR));
        return;
    }

    const auto& indices = units.filtered_indices();
    if (indices.empty()) {
        mvwprintw(unit_win_, 2, 2, "%s", units.units().empty() ? "No units" : "No units match the filters");
        return;
    }

    // Column layout shrinks with the panel
    const int inner = max_x - 4;
    const int state_width = 10;
    const bool show_detail = units.category() == UnitCategory::Timer || units.category() == UnitCategory::Socket;
    const bool show_description = !session_->log_focus();
    int name_width = std::max(12, std::min(40, inner - 2 * (state_width + 1)));
    int detail_width = show_detail ? std::min(28, std::max(0, inner - name_width - 2 * (state_width + 1) - 1)) : 0;

    wattron(unit_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    std::string header = std::format("{:<{}} {:<{}} {:<{}}", "Unit", name_width, "Active", state_width,
                                     "Sub", state_width);
    if (detail_width > 0) header += std::format(" {:<{}}", units.category() == UnitCategory::Timer ? "Next" : "Listen",
                                                detail_width);
    if (show_description) header += " Description";
    mvwprintw(unit_win_, 1, 2, "%s", truncate_text(header, inner).c_str());
    wattroff(unit_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    int available_rows = max_y - 3;  // Account for border and header
    visible_unit_rows_ = available_rows;
    scroll_to_selection();

    auto selected = units.selected();
    int row = 2;
    for (size_t pos = static_cast<size_t>(unit_scroll_offset_); pos < indices.size() && row < max_y - 1; ++pos) {
        const Unit& unit = units.units()[indices[pos]];
        bool is_selected = selected && *selected == pos;

        std::string line = std::format("{:<{}} {:<{}} {:<{}}", truncate_text(unit.name, name_width), name_width,
                                       truncate_text(unit.active_state, state_width), state_width,
                                       truncate_text(unit.sub_state, state_width), state_width);
        if (detail_width > 0) {
            line += std::format(" {:<{}}", truncate_text(unit.detail.value_or(""), detail_width), detail_width);
        }
        if (show_description) line += " " + unit.description;

        int color = is_selected ? COLOR_PAIR_SELECTED : get_status_color(unit.sub_state);
        wattron(unit_win_, COLOR_PAIR(color));
        if (is_selected) mvwhline(unit_win_, row, 1, ' ', max_x - 2);
        mvwprintw(unit_win_, row, 2, "%s", truncate_text(line, inner).c_str());
        wattroff(unit_win_, COLOR_PAIR(color));

        row++;
    }

    // Scroll indicators
    if (unit_scroll_offset_ > 0) {
        wattron(unit_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(unit_win_, 1, max_x - 4, "^^^");
        wattroff(unit_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (unit_scroll_offset_ + available_rows < static_cast<int>(indices.size())) {
        wattron(unit_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(unit_win_, max_y - 2, max_x - 4, "vvv");
        wattroff(unit_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

void TuiApp::render_status_bar(Clock::time_point now) {
    int max_x = getmaxx(status_win_);
    const Mode mode = session_->mode();
    const auto& actions = session_->actions();

    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));

    if (mode == Mode::SearchTyping) {
        mvwprintw(status_win_, 0, 1, "/%s", session_->units().search_query().c_str());
        wattron(status_win_, A_REVERSE);
        waddch(status_win_, ' ');
        wattroff(status_win_, A_REVERSE);
        return;
    }
    if (mode == Mode::LogSearchTyping) {
        mvwprintw(status_win_, 0, 1, "log /%s", session_->logs().search_query().c_str());
        wattron(status_win_, A_REVERSE);
        waddch(status_win_, ' ');
        wattroff(status_win_, A_REVERSE);
        return;
    }

    // Running action indicator blinks
    if (actions.phase() == ActionPhase::Executing && actions.pending()) {
        if (session_->blink_on(now)) {
            std::string label = actions.pending()->unit_name.empty()
                ? std::string(action_progress_label(actions.pending()->action))
                : std::format("{} {}", action_progress_label(actions.pending()->action), actions.pending()->unit_name);
            wattron(status_win_, COLOR_PAIR(COLOR_PAIR_WARNING) | A_BOLD);
            mvwprintw(status_win_, 0, 1, "%s", truncate_text(label, max_x - 2).c_str());
            wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_WARNING) | A_BOLD);
        }
        return;
    }

    // Most recent parse or fetch error
    auto errors = session_->recent_errors();
    if (!errors.empty()) {
        const auto& latest = errors.back();
        const std::string text = std::format("{}: {}", latest.command, latest.message);
        wattron(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR));
        mvwprintw(status_win_, 0, 1, "%s", truncate_text(text, max_x - 2).c_str());
        wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR));
        return;
    }

    const char* hints = session_->log_focus()
        ? "j/k scroll  g/G top/bottom  / search  n/N match  F live  p severity  T range  l units  ? help"
        : "j/k move  / search  s status  t type  f file  u scope  a action  i details  c file  l logs  ? help  q quit";
    mvwprintw(status_win_, 0, 1, "%s", truncate_text(hints, max_x - 2).c_str());
}

} // namespace svcdeck
