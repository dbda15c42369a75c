#include "doctest.h"

#include "unit_filter.hpp"
#include "fake_sources.hpp"
#include "text_format.hpp"

#include <string>
#include <vector>

using namespace svcdeck;
using svcdeck::tests::make_unit;

namespace {

std::vector<Unit> sample_units() {
    return {
        make_unit("a.service", "running", "Alpha daemon", "enabled"),
        make_unit("b.service", "dead", "Bravo helper", "disabled"),
        make_unit("c.service", "running", "Charlie ALPHA mirror", "static"),
    };
}

} // namespace

TEST_CASE("UnitFilter: sub-state filter keeps matching indices in order") {
    UnitFilter filter;
    filter.replace_units(sample_units());
    filter.set_filter(FilterField::SubState, "running");

    CHECK(filter.filtered_indices() == std::vector<size_t>{0, 2});

    filter.select(1);
    REQUIRE(filter.selected_unit() != nullptr);
    CHECK(filter.selected_unit()->name == "c.service");
}

TEST_CASE("UnitFilter: search covers name and description case-insensitively") {
    UnitFilter filter;
    filter.replace_units(sample_units());

    filter.set_filter(FilterField::Search, "alpha");
    CHECK(filter.filtered_indices() == std::vector<size_t>{0, 2});

    filter.set_filter(FilterField::Search, "B.SERV");
    CHECK(filter.filtered_indices() == std::vector<size_t>{1});

    // Empty text removes the predicate
    filter.set_filter(FilterField::Search, "");
    CHECK(filter.filtered_indices().size() == 3);
    CHECK_FALSE(filter.has_active_filters());
}

TEST_CASE("UnitFilter: predicates combine") {
    UnitFilter filter;
    filter.replace_units(sample_units());
    filter.set_filter(FilterField::Search, "alpha");
    filter.set_filter(FilterField::FileState, "static");

    CHECK(filter.filtered_indices() == std::vector<size_t>{2});
    CHECK(filter.has_active_filters());

    filter.clear_filters();
    CHECK(filter.filtered_indices().size() == 3);
}

TEST_CASE("UnitFilter: every predicate combination yields the AND-subset in order") {
    const std::vector<Unit> units = {
        make_unit("web-a.service", "running", "Web frontend", "enabled"),
        make_unit("db.service", "running", "Database", "disabled"),
        make_unit("web-b.service", "dead", "Web backup", "enabled"),
        make_unit("cache.service", "running", "WEB cache", "enabled"),
        make_unit("mail.service", "exited", "Mail relay", "static"),
        make_unit("web-c.service", "running", "Worker", "static"),
    };

    for (const char* preselected : {"mail.service", "cache.service"}) {
        for (int mask = 0; mask < 8; ++mask) {
            const bool use_search = (mask & 1) != 0;
            const bool use_sub_state = (mask & 2) != 0;
            const bool use_file_state = (mask & 4) != 0;
            CAPTURE(preselected);
            CAPTURE(mask);

            UnitFilter filter;
            filter.replace_units(units);
            for (size_t pos = 0; pos < units.size(); ++pos) {
                if (units[pos].name == preselected) filter.select(pos);
            }

            if (use_search) filter.set_filter(FilterField::Search, "web");
            if (use_sub_state) filter.set_filter(FilterField::SubState, "running");
            if (use_file_state) filter.set_filter(FilterField::FileState, "enabled");

            std::vector<size_t> expected;
            for (size_t i = 0; i < units.size(); ++i) {
                const Unit& unit = units[i];
                const bool text_ok = !use_search || to_lower(unit.name).find("web") != std::string::npos ||
                                     to_lower(unit.description).find("web") != std::string::npos;
                const bool sub_ok = !use_sub_state || unit.sub_state == "running";
                const bool file_ok = !use_file_state || unit.file_state == std::string("enabled");
                if (text_ok && sub_ok && file_ok) expected.push_back(i);
            }

            CHECK(filter.filtered_indices() == expected);

            if (expected.empty()) {
                CHECK_FALSE(filter.selected().has_value());
                continue;
            }
            REQUIRE(filter.selected().has_value());
            REQUIRE(*filter.selected() < expected.size());

            bool kept = false;
            for (size_t i : expected) {
                if (units[i].name == preselected) kept = true;
            }
            if (kept) {
                CHECK(filter.selected_unit()->name == preselected);
            } else {
                CHECK(*filter.selected() == 0);
            }

            filter.clear_filters();
            std::vector<size_t> all(units.size());
            for (size_t i = 0; i < all.size(); ++i) all[i] = i;
            CHECK(filter.filtered_indices() == all);
        }
    }
}

TEST_CASE("UnitFilter: no match leaves an empty selection") {
    UnitFilter filter;
    filter.replace_units(sample_units());
    filter.set_filter(FilterField::SubState, "failed");

    CHECK(filter.filtered_indices().empty());
    CHECK_FALSE(filter.selected().has_value());
    CHECK(filter.selected_unit() == nullptr);

    // Movement on an empty view is a no-op
    filter.move_next();
    filter.page_down(10);
    CHECK_FALSE(filter.selected().has_value());
}

TEST_CASE("UnitFilter: refresh keeps the selected unit by name") {
    UnitFilter filter;
    filter.replace_units(sample_units());
    filter.select(2);

    // c.service moves to the front
    filter.replace_units({
        make_unit("c.service", "running"),
        make_unit("a.service", "running"),
    });
    REQUIRE(filter.selected_unit() != nullptr);
    CHECK(filter.selected_unit()->name == "c.service");
    CHECK(filter.selected() == 0u);
}

TEST_CASE("UnitFilter: refresh without the selected unit falls back to the first row") {
    UnitFilter filter;
    filter.replace_units(sample_units());
    filter.select(1);

    filter.replace_units({
        make_unit("a.service", "running"),
        make_unit("c.service", "running"),
    });
    CHECK(filter.selected() == 0u);
}

TEST_CASE("UnitFilter: filter change keeps a still-visible selection") {
    UnitFilter filter;
    filter.replace_units(sample_units());
    filter.select(2);

    filter.set_filter(FilterField::SubState, "running");
    REQUIRE(filter.selected_unit() != nullptr);
    CHECK(filter.selected_unit()->name == "c.service");

    filter.set_filter(FilterField::SubState, "dead");
    CHECK(filter.selected_unit()->name == "b.service");
}

TEST_CASE("UnitFilter: next and previous wrap, paging clamps") {
    UnitFilter filter;
    std::vector<Unit> units;
    for (int i = 0; i < 10; ++i) units.push_back(make_unit("u" + std::to_string(i), "running"));
    filter.replace_units(units);

    CHECK(filter.selected() == 0u);
    filter.move_previous();
    CHECK(filter.selected() == 9u);
    filter.move_next();
    CHECK(filter.selected() == 0u);

    filter.page_down(4);
    CHECK(filter.selected() == 4u);
    filter.page_down(100);
    CHECK(filter.selected() == 9u);
    filter.page_up(3);
    CHECK(filter.selected() == 6u);
    filter.page_up(100);
    CHECK(filter.selected() == 0u);

    filter.go_to_bottom();
    CHECK(filter.selected() == 9u);
    filter.go_to_top();
    CHECK(filter.selected() == 0u);

    // Out of range selection is ignored
    filter.select(42);
    CHECK(filter.selected() == 0u);
}

TEST_CASE("UnitFilter: switching category drops inventory and predicates") {
    UnitFilter filter;
    filter.replace_units(sample_units());
    filter.set_filter(FilterField::Search, "alpha");
    filter.set_filter(FilterField::SubState, "running");
    filter.set_fetch_error("boom");

    filter.set_category(UnitCategory::Timer);
    CHECK(filter.category() == UnitCategory::Timer);
    CHECK(filter.units().empty());
    CHECK(filter.search_query().empty());
    CHECK_FALSE(filter.sub_state_filter().has_value());
    CHECK_FALSE(filter.fetch_error().has_value());
    CHECK_FALSE(filter.selected().has_value());

    filter.replace_units(sample_units());
    filter.set_filter(FilterField::FileState, "enabled");
    filter.set_scope(Scope::User);
    CHECK(filter.scope() == Scope::User);
    CHECK_FALSE(filter.file_state_filter().has_value());
    CHECK(filter.filtered_indices().empty());
}

TEST_CASE("UnitFilter: fetch error is cleared by a successful replace") {
    UnitFilter filter;
    filter.set_fetch_error("systemctl failed");
    REQUIRE(filter.fetch_error().has_value());

    filter.replace_units(sample_units());
    CHECK_FALSE(filter.fetch_error().has_value());
}
