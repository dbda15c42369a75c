#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../text_format.hpp"
#include <algorithm>
#include <format>

namespace svcdeck {

namespace {

const char* marker_text(Discontinuity marker) {
    switch (marker) {
        case Discontinuity::Reboot:  return "── reboot ──";
        case Discontinuity::Restart: return "── service restarted ──";
        case Discontinuity::None:    break;
    }
    return "";
}

} // namespace

void TuiApp::render_log_panel() {
    if (!log_win_) return;

    int max_y, max_x;
    getmaxyx(log_win_, max_y, max_x);

    const auto& logs = session_->logs();

    std::string title = logs.target() ? "[Logs: " + *logs.target() + "]" : "[Logs]";
    title += logs.live_tail() ? " LIVE" : " PAUSED";
    if (logs.severity()) title += std::format(" <={}", priority_label(*logs.severity()));
    if (logs.time_range() != TimeRange::All) title += std::format(" {}", time_range_label(logs.time_range()));
    if (!logs.search_query().empty()) {
        if (logs.current_match()) {
            title += std::format(" /{} {}/{}", logs.search_query(), *logs.current_match() + 1, logs.matches().size());
        } else {
            title += std::format(" /{} no match", logs.search_query());
        }
    }
    draw_box_title(log_win_, title);

    if (!logs.target()) {
        mvwprintw(log_win_, 1, 2, "No unit selected");
        return;
    }

    const auto& records = logs.records();
    if (records.empty()) {
        mvwprintw(log_win_, 1, 2, "No log entries");
        return;
    }

    const int width = std::max(1, max_x - 2);
    const int last_row = max_y - 2;
    const auto& matches = logs.matches();
    auto [first, end] = logs.visible_range();

    int row = 1;
    for (size_t i = first; i < end && row <= last_row; ++i) {
        Discontinuity marker = logs.marker_before(i);
        if (marker != Discontinuity::None) {
            std::string text = marker_text(marker);
            wattron(log_win_, COLOR_PAIR(COLOR_PAIR_MARKER) | A_BOLD);
            mvwprintw(log_win_, row, std::max(1, (max_x - static_cast<int>(text_columns(text))) / 2), "%s", text.c_str());
            wattroff(log_win_, COLOR_PAIR(COLOR_PAIR_MARKER) | A_BOLD);
            row++;
        }

        const LogRecord& record = records[i];
        int color = get_priority_color(record.priority);
        attr_t attrs = A_NORMAL;
        if (logs.is_current_match(i)) {
            color = COLOR_PAIR_HIGHLIGHT;
            attrs = A_BOLD;
        } else if (std::binary_search(matches.begin(), matches.end(), i)) {
            color = COLOR_PAIR_SEARCH;
        }

        wattron(log_win_, COLOR_PAIR(color) | attrs);
        for (const auto& line : wrap_text(format_log_line(record), width)) {
            if (row > last_row) break;
            mvwprintw(log_win_, row, 1, "%s", line.c_str());
            row++;
        }
        wattroff(log_win_, COLOR_PAIR(color) | attrs);
    }

    // Scroll indicator when not following the newest entries
    if (!logs.is_tracking_latest() && end < records.size()) {
        wattron(log_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(log_win_, max_y - 1, max_x - 6, "vvv");
        wattroff(log_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

} // namespace svcdeck
