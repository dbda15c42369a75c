#include "doctest.h"

#include "screen_layout.hpp"

using namespace svcdeck;

TEST_CASE("screen layout: modal scroll rows match the rows the modal draws") {
    for (int rows : {10, 24, 50}) {
        auto layout = compute_layout(rows, 100, false);
        // The modal is boxed, so it draws two rows fewer than its height
        CHECK(layout.geometry.details_rows == layout.modal_height - 2);
        CHECK(layout.modal_height == rows - 2);
    }
}

TEST_CASE("screen layout: unit list takes the full width without log focus") {
    auto layout = compute_layout(24, 100, false);
    CHECK(layout.unit_width == 100);
    CHECK_FALSE(layout.has_log_panel());
    CHECK(layout.middle_height == 22);
    CHECK(layout.geometry.unit_list_rows == 19);
    CHECK(layout.status_bar_y() == 23);
}

TEST_CASE("screen layout: log focus splits the width") {
    auto layout = compute_layout(24, 100, true);
    CHECK(layout.unit_width == 40);
    CHECK(layout.log_width == 60);
    CHECK(layout.geometry.log_rows == 20);
    CHECK(layout.geometry.log_columns == 58);
}

TEST_CASE("screen layout: a terminal too narrow for the log panel keeps only the unit list") {
    auto layout = compute_layout(24, 22, true);
    CHECK_FALSE(layout.has_log_panel());
    CHECK(layout.unit_width == 22);
}
