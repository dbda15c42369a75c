#include "tui_app.hpp"
#include <cctype>

namespace svcdeck {

namespace {

constexpr int kEscape = 27;
constexpr int kCtrlD = 4;
constexpr int kCtrlU = 21;

bool is_enter(int ch) {
    return ch == '\n' || ch == '\r' || ch == KEY_ENTER;
}

bool is_backspace(int ch) {
    return ch == KEY_BACKSPACE || ch == 127 || ch == 8;
}

} // namespace

void TuiApp::handle_input(int ch) {
    if (ch == KEY_MOUSE) {
        handle_mouse_event();
        return;
    }

    const Mode mode = session_->mode();

    // Help overlay: any key closes it and is consumed
    if (mode == Mode::Help) {
        session_->cancel();
        return;
    }

    if (is_picker_mode(mode)) {
        handle_picker_input(ch);
        return;
    }

    if (is_typing_mode(mode)) {
        handle_typing_input(ch);
        return;
    }

    if (mode == Mode::ConfirmDialog) {
        handle_confirm_input(ch);
        return;
    }

    if (mode == Mode::DetailsModal || mode == Mode::UnitFileViewer) {
        handle_modal_input(ch);
        return;
    }

    // Global keys
    switch (ch) {
        case 'q':
            session_->request_quit();
            return;

        case '?':
        case KEY_F(1):
            session_->open_help();
            return;

        case 'l':  // Toggle log panel focus
            session_->toggle_log_focus();
            return;

        case '/':
            session_->begin_search();
            return;

        case 'u':  // System / user manager
            session_->toggle_scope();
            unit_scroll_offset_ = 0;
            return;

        case 't':
            session_->open_category_picker();
            return;

        case 's':
            session_->open_status_picker();
            return;

        case 'f':
            session_->open_file_state_picker();
            return;

        case 'p':
            session_->open_severity_picker();
            return;

        case 'T':
            session_->open_time_range_picker();
            return;

        case 'i':
        case '\n':
        case '\r':
        case KEY_ENTER:
            session_->open_details();
            return;

        case 'c':
            session_->open_unit_file();
            return;

        case 'a':
            session_->open_action_picker();
            return;

        case 'r':
        case KEY_F(5):
            session_->reload();
            return;

        case kEscape:
            session_->escape();
            return;

        default:
            break;
    }

    if (session_->log_focus()) {
        handle_log_panel_input(ch);
    } else {
        handle_unit_list_input(ch);
    }
}

void TuiApp::handle_unit_list_input(int ch) {
    switch (ch) {
        case KEY_UP:
        case 'k':
            session_->select_previous();
            break;
        case KEY_DOWN:
        case 'j':
            session_->select_next();
            break;
        case KEY_PPAGE:
        case kCtrlU:
            session_->page_up();
            break;
        case KEY_NPAGE:
        case kCtrlD:
            session_->page_down();
            break;
        case KEY_HOME:
        case 'g':
            session_->select_first();
            break;
        case KEY_END:
        case 'G':
            session_->select_last();
            break;
        default:
            return;
    }
    scroll_to_selection();
}

void TuiApp::handle_log_panel_input(int ch) {
    switch (ch) {
        case KEY_UP:
        case 'k':
            session_->scroll_logs_up(1);
            break;
        case KEY_DOWN:
        case 'j':
            session_->scroll_logs_down(1);
            break;
        case KEY_PPAGE:
            session_->log_page_up();
            break;
        case KEY_NPAGE:
            session_->log_page_down();
            break;
        case kCtrlU:
            session_->log_half_page_up();
            break;
        case kCtrlD:
            session_->log_half_page_down();
            break;
        case KEY_HOME:
        case 'g':
            session_->logs_top();
            break;
        case KEY_END:
        case 'G':
            session_->logs_bottom();
            break;
        case 'n':
            session_->next_log_match();
            break;
        case 'N':
            session_->previous_log_match();
            break;
        case 'F':
            session_->toggle_live_tail();
            break;
        default:
            break;
    }
}

void TuiApp::handle_typing_input(int ch) {
    if (ch == kEscape || is_enter(ch)) {
        session_->finish_typing();
        scroll_to_selection();
        return;
    }

    if (is_backspace(ch)) {
        session_->erase_char();
    } else if (ch >= 32 && ch < 127 && std::isprint(ch)) {
        session_->type_char(static_cast<char>(ch));
    }
    scroll_to_selection();
}

void TuiApp::handle_picker_input(int ch) {
    switch (ch) {
        case kEscape:
        case 'q':
            session_->cancel();
            break;
        case KEY_UP:
        case 'k':
            session_->picker_previous();
            break;
        case KEY_DOWN:
        case 'j':
            session_->picker_next();
            break;
        case '\n':
        case '\r':
        case KEY_ENTER:
            session_->confirm_picker();
            unit_scroll_offset_ = 0;
            scroll_to_selection();
            break;
        default:
            break;
    }
}

void TuiApp::handle_confirm_input(int ch) {
    switch (session_->actions().phase()) {
        case ActionPhase::Confirming:
            if (ch == 'y' || ch == 'Y' || is_enter(ch)) {
                session_->confirm_action();
            } else if (ch == 'n' || ch == 'N' || ch == kEscape) {
                session_->dismiss_action();
            }
            break;

        case ActionPhase::Executing:
            // Hide the dialog; the result is discarded when it arrives
            if (ch == kEscape) {
                session_->dismiss_action();
            }
            break;

        case ActionPhase::Settled:
        case ActionPhase::Idle:
            session_->dismiss_action();
            break;
    }
}

void TuiApp::handle_modal_input(int ch) {
    switch (ch) {
        case kEscape:
        case 'q':
        case 'i':
        case 'c':
        case '\n':
        case '\r':
        case KEY_ENTER:
            session_->cancel();
            break;
        case KEY_UP:
        case 'k':
            session_->scroll_modal(-1);
            break;
        case KEY_DOWN:
        case 'j':
            session_->scroll_modal(1);
            break;
        case KEY_PPAGE:
            session_->modal_page_up();
            break;
        case KEY_NPAGE:
            session_->modal_page_down();
            break;
        case KEY_HOME:
        case 'g':
            session_->modal_top();
            break;
        case KEY_END:
        case 'G':
            session_->modal_bottom();
            break;
        default:
            break;
    }
}

void TuiApp::handle_mouse_event() {
    MEVENT event;
    if (getmouse(&event) != OK) {
        return;
    }

    const Mode mode = session_->mode();
    const bool wheel_up = (event.bstate & BUTTON4_PRESSED) != 0;
    const bool wheel_down = (event.bstate & BUTTON5_PRESSED) != 0;

    if (mode == Mode::DetailsModal || mode == Mode::UnitFileViewer) {
        if (wheel_up) session_->scroll_modal(-kMouseScrollStep);
        if (wheel_down) session_->scroll_modal(kMouseScrollStep);
        return;
    }

    if (!session_->modes().is_normal()) {
        return;
    }

    const bool over_units = event.x < unit_win_width_;

    // Handle mouse wheel scrolling
    if (wheel_up || wheel_down) {
        if (!over_units && session_->log_focus()) {
            if (wheel_up) {
                session_->scroll_logs_up(kMouseScrollStep);
            } else {
                session_->scroll_logs_down(kMouseScrollStep);
            }
            return;
        }
        for (int i = 0; i < kMouseScrollStep; ++i) {
            if (wheel_up) {
                if (session_->units().selected().value_or(0) == 0) break;
                session_->select_previous();
            } else {
                auto count = session_->units().filtered_indices().size();
                if (session_->units().selected().value_or(0) + 1 >= count) break;
                session_->select_next();
            }
        }
        scroll_to_selection();
        return;
    }

    // Handle clicks
    if (event.bstate & (BUTTON1_CLICKED | BUTTON1_PRESSED | BUTTON1_RELEASED)) {
        if (!over_units || event.y < unit_win_y_ || event.y >= unit_win_y_ + unit_win_height_) {
            return;
        }

        // Calculate which row was clicked (accounting for border and header)
        int row_in_window = event.y - unit_win_y_;
        if (row_in_window >= 2 && row_in_window < unit_win_height_ - 1) {
            int clicked_index = unit_scroll_offset_ + (row_in_window - 2);
            session_->select_position(static_cast<size_t>(clicked_index));
        }
    }
}

} // namespace svcdeck
