#include "unit_filter.hpp"
#include "text_format.hpp"
#include <algorithm>
#include <utility>

namespace svcdeck {

UnitFilter::UnitFilter(UnitCategory category, Scope scope)
    : category_(category)
    , scope_(scope)
{
}

void UnitFilter::replace_units(std::vector<Unit> units) {
    auto keep = selected_name();
    units_ = std::move(units);
    fetch_error_.reset();
    recompute(keep);
}

void UnitFilter::set_fetch_error(std::string message) {
    fetch_error_ = std::move(message);
}

void UnitFilter::clear_fetch_error() {
    fetch_error_.reset();
}

void UnitFilter::set_filter(FilterField field, std::optional<std::string> value) {
    if (value && value->empty()) {
        value.reset();
    }

    switch (field) {
        case FilterField::Search:
            search_query_ = value.value_or(std::string{});
            break;
        case FilterField::SubState:
            sub_state_filter_ = std::move(value);
            break;
        case FilterField::FileState:
            file_state_filter_ = std::move(value);
            break;
    }

    recompute(selected_name());
}

void UnitFilter::clear_filters() {
    search_query_.clear();
    sub_state_filter_.reset();
    file_state_filter_.reset();
    recompute(selected_name());
}

bool UnitFilter::has_active_filters() const {
    return !search_query_.empty() || sub_state_filter_.has_value() || file_state_filter_.has_value();
}

void UnitFilter::set_category(UnitCategory category) {
    category_ = category;
    units_.clear();
    fetch_error_.reset();
    search_query_.clear();
    sub_state_filter_.reset();
    file_state_filter_.reset();
    filtered_.clear();
    selected_.reset();
}

void UnitFilter::set_scope(Scope scope) {
    scope_ = scope;
    units_.clear();
    fetch_error_.reset();
    search_query_.clear();
    sub_state_filter_.reset();
    file_state_filter_.reset();
    filtered_.clear();
    selected_.reset();
}

const Unit* UnitFilter::selected_unit() const {
    if (!selected_ || *selected_ >= filtered_.size()) return nullptr;
    return &units_[filtered_[*selected_]];
}

void UnitFilter::select(size_t filtered_pos) {
    if (filtered_pos < filtered_.size()) {
        selected_ = filtered_pos;
    }
}

void UnitFilter::move_next() {
    if (filtered_.empty()) return;
    if (!selected_ || *selected_ + 1 >= filtered_.size()) {
        selected_ = 0;
    } else {
        selected_ = *selected_ + 1;
    }
}

void UnitFilter::move_previous() {
    if (filtered_.empty()) return;
    if (!selected_) {
        selected_ = 0;
    } else if (*selected_ == 0) {
        selected_ = filtered_.size() - 1;
    } else {
        selected_ = *selected_ - 1;
    }
}

void UnitFilter::go_to_top() {
    if (!filtered_.empty()) selected_ = 0;
}

void UnitFilter::go_to_bottom() {
    if (!filtered_.empty()) selected_ = filtered_.size() - 1;
}

void UnitFilter::page_up(size_t page_size) {
    if (filtered_.empty()) return;
    size_t current = selected_.value_or(0);
    selected_ = current > page_size ? current - page_size : 0;
}

void UnitFilter::page_down(size_t page_size) {
    if (filtered_.empty()) return;
    size_t current = selected_.value_or(0);
    selected_ = std::min(current + page_size, filtered_.size() - 1);
}

bool UnitFilter::matches(const Unit& unit, const std::string& query_lower) const {
    // Text, then sub-state, then file-state; all must hold
    if (!query_lower.empty() &&
        !contains_lower(unit.name, query_lower) &&
        !contains_lower(unit.description, query_lower)) {
        return false;
    }
    if (sub_state_filter_ && unit.sub_state != *sub_state_filter_) {
        return false;
    }
    if (file_state_filter_ && unit.file_state != *file_state_filter_) {
        return false;
    }
    return true;
}

void UnitFilter::recompute(const std::optional<std::string>& keep_selected_name) {
    const std::string query_lower = to_lower(search_query_);

    filtered_.clear();
    for (size_t i = 0; i < units_.size(); ++i) {
        if (matches(units_[i], query_lower)) {
            filtered_.push_back(i);
        }
    }

    selected_.reset();
    if (filtered_.empty()) return;

    if (keep_selected_name) {
        auto it = std::find_if(filtered_.begin(), filtered_.end(), [&](size_t idx) {
            return units_[idx].name == *keep_selected_name;
        });
        if (it != filtered_.end()) {
            selected_ = static_cast<size_t>(std::distance(filtered_.begin(), it));
            return;
        }
    }

    // Previous selection gone (or there was none): fall back to the first row
    selected_ = 0;
}

std::optional<std::string> UnitFilter::selected_name() const {
    if (const Unit* unit = selected_unit()) {
        return unit->name;
    }
    return std::nullopt;
}

} // namespace svcdeck
