#pragma once

#include "session.hpp"

namespace svcdeck {

// Window placement for one terminal size. The TUI creates its windows from
// this and the session scrolls against the same row counts.
struct ScreenLayout {
    static constexpr int kHeaderHeight = 1;
    static constexpr int kStatusBarHeight = 1;
    static constexpr double kUnitPanelRatio = 0.4;  // Share of width while logs are shown
    static constexpr int kMinUnitWidth = 20;

    int screen_width = 0;
    int middle_height = 0;  // Between header and status bar
    int unit_width = 0;
    int log_width = 0;      // 0 when the log panel is hidden
    int modal_height = 0;
    int modal_width = 0;

    ViewportGeometry geometry;

    bool has_log_panel() const { return log_width > 0; }
    int status_bar_y() const { return kHeaderHeight + middle_height; }
};

ScreenLayout compute_layout(int screen_rows, int screen_columns, bool log_focus);

} // namespace svcdeck
