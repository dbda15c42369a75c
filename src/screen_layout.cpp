#include "screen_layout.hpp"
#include <algorithm>

namespace svcdeck {

ScreenLayout compute_layout(int screen_rows, int screen_columns, bool log_focus) {
    ScreenLayout layout;
    layout.screen_width = screen_columns;
    layout.middle_height = std::max(3, screen_rows - ScreenLayout::kHeaderHeight - ScreenLayout::kStatusBarHeight);

    layout.unit_width = screen_columns;
    if (log_focus) {
        int unit_width = std::max(ScreenLayout::kMinUnitWidth,
                                  static_cast<int>(screen_columns * ScreenLayout::kUnitPanelRatio));
        int log_width = screen_columns - unit_width;
        // Too narrow for a bordered panel: the unit list keeps the whole width
        if (log_width > 4) {
            layout.unit_width = unit_width;
            layout.log_width = log_width;
        }
    }

    // Text modals leave one row above and below and two columns either side
    layout.modal_height = std::max(3, screen_rows - 2);
    layout.modal_width = std::max(8, screen_columns - 4);

    layout.geometry.unit_list_rows = std::max(1, layout.middle_height - 3);  // Border and column header
    layout.geometry.log_rows = layout.has_log_panel() ? std::max(1, layout.middle_height - 2) : 1;
    layout.geometry.log_columns = layout.has_log_panel() ? std::max(1, layout.log_width - 2) : 1;
    layout.geometry.details_rows = std::max(1, layout.modal_height - 2);  // Modal border
    return layout;
}

} // namespace svcdeck
