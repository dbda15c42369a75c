#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../text_format.hpp"
#include <algorithm>
#include <cstdio>
#include <spdlog/spdlog.h>

namespace svcdeck {

TuiApp::TuiApp(Session* session)
    : session_(session)
{
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    set_escdelay(25);
    mouseinterval(0);  // Disable mouse click delay

    // Enable mouse support (clicks and wheel)
    mousemask(ALL_MOUSE_EVENTS, nullptr);

    init_colors();

    std::printf("\033]0;svcdeck\007");
    std::fflush(stdout);

    create_windows();
    session_->start();

    while (!session_->quit_requested()) {
        if (layout_log_focus_ != session_->log_focus()) {
            resize_windows();
        }

        auto now = Clock::now();
        session_->tick(now);
        render(now);

        // Block until input or the next timer is due
        auto wait = session_->next_wait(Clock::now());
        timeout(static_cast<int>(wait.count()));

        int ch = getch();
        if (ch == KEY_RESIZE) {
            resize_windows();
            continue;
        }
        if (ch != ERR) {
            handle_input(ch);
        }
    }

    spdlog::info("quit requested");
    cleanup_windows();
    endwin();

    // Reset terminal title
    std::printf("\033]0;\007");
    std::fflush(stdout);
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    layout_log_focus_ = session_->log_focus();
    layout_ = compute_layout(max_y, max_x, layout_log_focus_);

    header_win_ = newwin(ScreenLayout::kHeaderHeight, max_x, 0, 0);

    // Track unit window position for mouse clicks
    unit_win_y_ = ScreenLayout::kHeaderHeight;
    unit_win_height_ = layout_.middle_height;
    unit_win_width_ = layout_.unit_width;
    unit_win_ = newwin(layout_.middle_height, layout_.unit_width, ScreenLayout::kHeaderHeight, 0);
    visible_unit_rows_ = layout_.geometry.unit_list_rows;

    if (layout_.has_log_panel()) {
        log_win_ = newwin(layout_.middle_height, layout_.log_width, ScreenLayout::kHeaderHeight, layout_.unit_width);
    }

    status_win_ = newwin(ScreenLayout::kStatusBarHeight, max_x, layout_.status_bar_y(), 0);

    session_->set_geometry(layout_.geometry);

    keypad(unit_win_, TRUE);
    if (log_win_) keypad(log_win_, TRUE);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    clear();
    refresh();
    create_windows();
}

void TuiApp::cleanup_windows() {
    for (WINDOW** win : {&header_win_, &unit_win_, &log_win_, &status_win_}) {
        if (*win) {
            delwin(*win);
            *win = nullptr;
        }
    }
}

void TuiApp::render(Clock::time_point now) {
    werase(header_win_);
    werase(unit_win_);
    if (log_win_) werase(log_win_);
    werase(status_win_);

    render_header();
    render_unit_list();
    if (log_win_) {
        render_log_panel();
    }
    render_status_bar(now);

    wnoutrefresh(header_win_);
    wnoutrefresh(unit_win_);
    if (log_win_) wnoutrefresh(log_win_);
    wnoutrefresh(status_win_);

    // Overlays draw into temporary windows on top
    switch (session_->mode()) {
        case Mode::StatusPicker:
        case Mode::CategoryPicker:
        case Mode::SeverityPicker:
        case Mode::TimeRangePicker:
        case Mode::FileStatePicker:
        case Mode::ActionPicker:
            render_picker();
            break;
        case Mode::ConfirmDialog:
            render_confirm_dialog(now);
            break;
        case Mode::DetailsModal:
            render_text_modal("Details: " + session_->details().unit_name, session_->details().lines,
                              session_->details().scroll, false);
            break;
        case Mode::UnitFileViewer:
            render_text_modal("Unit file: " + session_->unit_file().unit_name, session_->unit_file().lines,
                              session_->unit_file().scroll, session_->unit_file().is_error);
            break;
        case Mode::Help:
            render_help_overlay();
            break;
        default:
            break;
    }

    doupdate();
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    box(win, 0, 0);
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

WINDOW* TuiApp::make_dialog(int height, int width, const std::string& title) {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    height = std::min(height, max_y);
    width = std::min(width, max_x);
    WINDOW* win = newwin(height, width, (max_y - height) / 2, (max_x - width) / 2);
    if (!win) return nullptr;

    wbkgd(win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(win, 0, 0);
    if (!title.empty()) {
        std::string text = " " + title + " ";
        text = truncate_text(text, width - 2);
        wattron(win, A_BOLD);
        mvwprintw(win, 0, std::max(1, (width - static_cast<int>(text_columns(text))) / 2), "%s", text.c_str());
        wattroff(win, A_BOLD);
    }
    return win;
}

void TuiApp::scroll_to_selection() {
    auto selected = session_->units().selected();
    if (!selected) {
        unit_scroll_offset_ = 0;
        return;
    }

    int selected_idx = static_cast<int>(*selected);
    if (selected_idx < unit_scroll_offset_) {
        unit_scroll_offset_ = selected_idx;
    } else if (selected_idx >= unit_scroll_offset_ + visible_unit_rows_) {
        unit_scroll_offset_ = selected_idx - visible_unit_rows_ + 1;
    }

    int count = static_cast<int>(session_->units().filtered_indices().size());
    unit_scroll_offset_ = std::clamp(unit_scroll_offset_, 0, std::max(0, count - visible_unit_rows_));
}

} // namespace svcdeck
