#pragma once

#include "unit_info.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace svcdeck {

enum class FilterField {
    Search,     // case-insensitive substring over name + description
    SubState,   // exact sub-state match
    FileState   // exact enablement-state match
};

// Owns the unit inventory for one category/scope, the active predicates,
// the derived filtered view and the selection cursor into that view.
// Invariant: filtered indices are strictly increasing valid unit indices and
// the selection is either empty or a valid position in the filtered list.
class UnitFilter {
public:
    explicit UnitFilter(UnitCategory category = UnitCategory::Service, Scope scope = Scope::System);

    // Replace the inventory. Filters survive; the selected unit stays selected
    // (matched by name) only if it is still present and matching.
    void replace_units(std::vector<Unit> units);

    void set_fetch_error(std::string message);
    void clear_fetch_error();
    const std::optional<std::string>& fetch_error() const { return fetch_error_; }

    // Empty value (or empty search text) removes the predicate
    void set_filter(FilterField field, std::optional<std::string> value);
    void clear_filters();

    const std::string& search_query() const { return search_query_; }
    const std::optional<std::string>& sub_state_filter() const { return sub_state_filter_; }
    const std::optional<std::string>& file_state_filter() const { return file_state_filter_; }
    [[nodiscard]] bool has_active_filters() const;

    // Switching category or scope drops the inventory, the selection and all
    // non-category predicates. The caller fetches the new inventory.
    void set_category(UnitCategory category);
    void set_scope(Scope scope);
    UnitCategory category() const { return category_; }
    Scope scope() const { return scope_; }

    const std::vector<Unit>& units() const { return units_; }
    const std::vector<size_t>& filtered_indices() const { return filtered_; }
    std::optional<size_t> selected() const { return selected_; }
    [[nodiscard]] const Unit* selected_unit() const;

    // Out-of-range positions are ignored
    void select(size_t filtered_pos);

    // Cursor movement over the filtered list. next/previous wrap, paging clamps.
    void move_next();
    void move_previous();
    void go_to_top();
    void go_to_bottom();
    void page_up(size_t page_size);
    void page_down(size_t page_size);

private:
    [[nodiscard]] bool matches(const Unit& unit, const std::string& query_lower) const;
    void recompute(const std::optional<std::string>& keep_selected_name);
    [[nodiscard]] std::optional<std::string> selected_name() const;

    UnitCategory category_;
    Scope scope_;

    std::vector<Unit> units_;
    std::optional<std::string> fetch_error_;

    std::string search_query_;
    std::optional<std::string> sub_state_filter_;
    std::optional<std::string> file_state_filter_;

    std::vector<size_t> filtered_;
    std::optional<size_t> selected_;
};

} // namespace svcdeck
