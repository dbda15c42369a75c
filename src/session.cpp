#include "session.hpp"
#include "unit_details.hpp"
#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace svcdeck {

Session::Session(std::unique_ptr<IUnitSource> unit_source,
                 std::unique_ptr<ILogSource> log_source,
                 UnitSourceFactory worker_source_factory,
                 SessionConfig config)
    : config_(config)
    , unit_source_(std::move(unit_source))
    , log_source_(std::move(log_source))
    , filter_(config.initial_category, config.initial_scope)
    , logs_(log_source_.get(), config.log_line_limit)
    , actions_(std::move(worker_source_factory)) {
    logs_.set_tail_interval(config_.tail_interval);
    logs_.set_live_tail(config_.live_tail);
}

void Session::start() {
    reload();
}

void Session::reload() {
    auto result = unit_source_->list_units(filter_.category(), filter_.scope());
    if (!result.success) {
        spdlog::warn("listing {} ({}) failed: {}", category_label(filter_.category()),
                     scope_label(filter_.scope()), result.error_message);
        filter_.set_fetch_error(std::move(result.error_message));
        return;
    }

    spdlog::debug("listed {} {} ({})", result.units.size(), category_label(filter_.category()),
                  scope_label(filter_.scope()));
    filter_.clear_fetch_error();
    filter_.replace_units(std::move(result.units));
}

void Session::set_geometry(const ViewportGeometry& geometry) {
    geometry_ = geometry;
    logs_.set_geometry(geometry.log_rows, geometry.log_columns);
}

void Session::tick(Clock::time_point now) {
    actions_.poll();
    if (auto refresh = actions_.take_refresh()) {
        apply_refresh(std::move(*refresh));
    }

    if (modes_.log_focus()) {
        sync_log_target();
        logs_.ensure_loaded();
        logs_.poll_tail(now);
    }
}

std::chrono::milliseconds Session::next_wait(Clock::time_point now) const {
    using std::chrono::milliseconds;
    milliseconds wait = config_.idle_wait;

    if (modes_.log_focus()) {
        if (auto deadline = logs_.next_tail_deadline()) {
            auto until = std::chrono::duration_cast<milliseconds>(*deadline - now);
            wait = std::min(wait, std::max(until, milliseconds(0)));
        }
    }

    if (actions_.phase() == ActionPhase::Executing || actions_.refresh_pending()) {
        wait = std::min(wait, config_.action_poll_interval);
    }

    if (actions_.phase() == ActionPhase::Executing && config_.blink_interval.count() > 0) {
        auto elapsed = std::chrono::duration_cast<milliseconds>(now - actions_.executing_since());
        auto until_blink = config_.blink_interval - elapsed % config_.blink_interval;
        wait = std::min(wait, until_blink);
    }

    return wait;
}

bool Session::blink_on(Clock::time_point now) const {
    if (config_.blink_interval.count() <= 0) return true;
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - actions_.executing_since());
    return (elapsed / config_.blink_interval) % 2 == 0;
}

void Session::apply_refresh(InventoryRefresh refresh) {
    if (refresh.category != filter_.category() || refresh.scope != filter_.scope()) {
        spdlog::debug("dropping stale inventory refresh for {} ({})",
                      category_label(refresh.category), scope_label(refresh.scope));
        return;
    }

    if (!refresh.result.success) {
        spdlog::warn("post-action refresh failed: {}", refresh.result.error_message);
        return;
    }

    filter_.clear_fetch_error();
    filter_.replace_units(std::move(refresh.result.units));
    properties_cache_.clear();
}

void Session::sync_log_target() {
    const Unit* unit = filter_.selected_unit();
    std::optional<std::string> target;
    if (unit) target = unit->name;
    if (target != logs_.target()) {
        logs_.set_target(std::move(target), filter_.scope());
    }
}

void Session::select_next() { filter_.move_next(); }
void Session::select_previous() { filter_.move_previous(); }
void Session::select_first() { filter_.go_to_top(); }
void Session::select_last() { filter_.go_to_bottom(); }
void Session::page_up() { filter_.page_up(static_cast<size_t>(std::max(geometry_.unit_list_rows, 1))); }
void Session::page_down() { filter_.page_down(static_cast<size_t>(std::max(geometry_.unit_list_rows, 1))); }
void Session::select_position(size_t filtered_pos) { filter_.select(filtered_pos); }

void Session::toggle_log_focus() {
    if (modes_.log_focus()) {
        logs_.clear_search();
        modes_.set_log_focus(false);
        return;
    }
    modes_.set_log_focus(true);
    sync_log_target();
    logs_.ensure_loaded();
}

void Session::begin_search() {
    modes_.enter(modes_.log_focus() ? Mode::LogSearchTyping : Mode::SearchTyping);
}

void Session::type_char(char c) {
    if (modes_.mode() == Mode::SearchTyping) {
        std::string query = filter_.search_query();
        query.push_back(c);
        filter_.set_filter(FilterField::Search, std::move(query));
    } else if (modes_.mode() == Mode::LogSearchTyping) {
        std::string query = logs_.search_query();
        query.push_back(c);
        logs_.set_search_query(std::move(query));
    }
}

void Session::erase_char() {
    if (modes_.mode() == Mode::SearchTyping) {
        std::string query = filter_.search_query();
        if (query.empty()) return;
        query.pop_back();
        filter_.set_filter(FilterField::Search, std::move(query));
    } else if (modes_.mode() == Mode::LogSearchTyping) {
        std::string query = logs_.search_query();
        if (query.empty()) return;
        query.pop_back();
        if (query.empty()) {
            logs_.clear_search();
        } else {
            logs_.set_search_query(std::move(query));
        }
    }
}

void Session::finish_typing() {
    if (is_typing_mode(modes_.mode())) {
        modes_.close();
    }
}

void Session::escape() {
    if (!modes_.is_normal()) return;

    if (modes_.log_focus()) {
        if (!logs_.search_query().empty()) {
            logs_.clear_search();
        } else {
            modes_.set_log_focus(false);
        }
        return;
    }

    if (!filter_.search_query().empty()) {
        filter_.set_filter(FilterField::Search, std::nullopt);
    }
}

void Session::scroll_logs_up(size_t lines) { logs_.scroll_up(lines); }
void Session::scroll_logs_down(size_t lines) { logs_.scroll_down(lines); }
void Session::log_page_up() { logs_.scroll_up(static_cast<size_t>(logs_.rows())); }
void Session::log_page_down() { logs_.scroll_down(static_cast<size_t>(logs_.rows())); }
void Session::log_half_page_up() { logs_.scroll_up(static_cast<size_t>(std::max(logs_.rows() / 2, 1))); }
void Session::log_half_page_down() { logs_.scroll_down(static_cast<size_t>(std::max(logs_.rows() / 2, 1))); }
void Session::logs_top() { logs_.go_to_top(); }
void Session::logs_bottom() { logs_.go_to_bottom(); }
void Session::toggle_live_tail() { logs_.toggle_live_tail(); }
void Session::next_log_match() { logs_.next_match(); }
void Session::previous_log_match() { logs_.previous_match(); }

void Session::open_status_picker() {
    modes_.open_picker(Mode::StatusPicker, make_status_picker(filter_.category(), filter_.sub_state_filter()));
}

void Session::open_category_picker() {
    modes_.open_picker(Mode::CategoryPicker, make_category_picker(filter_.category()));
}

void Session::open_severity_picker() {
    modes_.open_picker(Mode::SeverityPicker, make_severity_picker(logs_.severity()));
}

void Session::open_time_range_picker() {
    modes_.open_picker(Mode::TimeRangePicker, make_time_range_picker(logs_.time_range()));
}

void Session::open_file_state_picker() {
    modes_.open_picker(Mode::FileStatePicker, make_file_state_picker(filter_.file_state_filter()));
}

void Session::open_action_picker() {
    if (actions_.phase() != ActionPhase::Idle) return;

    const Unit* unit = filter_.selected_unit();
    if (unit) {
        action_choices_ = available_actions(unit->sub_state, unit->file_state);
    } else {
        action_choices_ = {UnitAction::DaemonReload};
    }
    modes_.open_picker(Mode::ActionPicker, make_action_picker(action_choices_, unit ? unit->name : std::string()));
}

void Session::picker_next() {
    if (is_picker_mode(modes_.mode())) modes_.picker().next();
}

void Session::picker_previous() {
    if (is_picker_mode(modes_.mode())) modes_.picker().previous();
}

void Session::confirm_picker() {
    const Picker& picker = modes_.picker();
    const size_t cursor = picker.cursor();

    switch (modes_.mode()) {
        case Mode::StatusPicker:
            filter_.set_filter(FilterField::SubState, option_filter_value(picker));
            break;
        case Mode::FileStatePicker:
            filter_.set_filter(FilterField::FileState, option_filter_value(picker));
            break;
        case Mode::SeverityPicker:
            logs_.set_severity(severity_from_cursor(cursor));
            break;
        case Mode::TimeRangePicker:
            if (cursor < kTimeRanges.size()) logs_.set_time_range(kTimeRanges[cursor]);
            break;
        case Mode::CategoryPicker: {
            if (cursor >= kUnitCategories.size()) break;
            const UnitCategory category = kUnitCategories[cursor];
            modes_.close();
            switch_category(category);
            return;
        }
        case Mode::ActionPicker: {
            if (cursor >= action_choices_.size()) break;
            const UnitAction action = action_choices_[cursor];
            const Unit* unit = filter_.selected_unit();
            std::string name = unit && !is_host_wide(action) ? unit->name : std::string();
            if (actions_.request(action, std::move(name))) {
                modes_.enter(Mode::ConfirmDialog);
                return;
            }
            break;
        }
        default:
            return;
    }
    modes_.close();
}

void Session::cancel() {
    switch (modes_.mode()) {
        case Mode::Normal:
            return;
        case Mode::ConfirmDialog:
            dismiss_action();
            return;
        default:
            modes_.close();
            return;
    }
}

void Session::confirm_action() {
    if (modes_.mode() != Mode::ConfirmDialog) return;

    switch (actions_.phase()) {
        case ActionPhase::Confirming:
            actions_.confirm(filter_.category(), filter_.scope());
            break;
        case ActionPhase::Settled:
            dismiss_action();
            break;
        default:
            break;
    }
}

void Session::dismiss_action() {
    actions_.dismiss();
    if (modes_.mode() == Mode::ConfirmDialog) {
        modes_.close();
    }
}

const UnitProperties& Session::properties_for(const std::string& unit_name) {
    auto it = properties_cache_.find(unit_name);
    if (it == properties_cache_.end()) {
        it = properties_cache_.emplace(unit_name, unit_source_->get_properties(unit_name, filter_.scope())).first;
    }
    return it->second;
}

void Session::open_details() {
    const Unit* unit = filter_.selected_unit();
    if (!unit || !modes_.is_normal()) return;

    details_.unit_name = unit->name;
    details_.lines = format_unit_details(unit->name, filter_.category(), properties_for(unit->name));
    details_.scroll = 0;
    modes_.enter(Mode::DetailsModal);
}

void Session::open_unit_file() {
    const Unit* unit = filter_.selected_unit();
    if (!unit || !modes_.is_normal()) return;

    unit_file_.unit_name = unit->name;
    unit_file_.scroll = 0;

    auto result = unit_source_->get_file_content(unit->name, filter_.scope());
    if (result.success) {
        unit_file_.lines = std::move(result.lines);
        unit_file_.is_error = false;
    } else {
        spdlog::warn("reading unit file of {} failed: {}", unit->name, result.error_message);
        unit_file_.lines = {std::format("Error: {}", result.error_message)};
        unit_file_.is_error = true;
    }
    modes_.enter(Mode::UnitFileViewer);
}

size_t Session::modal_line_count() const {
    if (modes_.mode() == Mode::DetailsModal) return details_.lines.size();
    if (modes_.mode() == Mode::UnitFileViewer) return unit_file_.lines.size();
    return 0;
}

size_t& Session::modal_scroll() {
    return modes_.mode() == Mode::UnitFileViewer ? unit_file_.scroll : details_.scroll;
}

void Session::scroll_modal(int delta) {
    if (modes_.mode() != Mode::DetailsModal && modes_.mode() != Mode::UnitFileViewer) return;

    const size_t rows = static_cast<size_t>(std::max(geometry_.details_rows, 1));
    const size_t count = modal_line_count();
    const size_t max_scroll = count > rows ? count - rows : 0;

    size_t& scroll = modal_scroll();
    if (delta < 0) {
        const size_t up = static_cast<size_t>(-static_cast<long long>(delta));
        scroll = scroll > up ? scroll - up : 0;
    } else {
        scroll = std::min(scroll + static_cast<size_t>(delta), max_scroll);
    }
}

void Session::modal_page_up() { scroll_modal(-std::max(geometry_.details_rows, 1)); }
void Session::modal_page_down() { scroll_modal(std::max(geometry_.details_rows, 1)); }

void Session::modal_top() {
    if (modes_.mode() != Mode::DetailsModal && modes_.mode() != Mode::UnitFileViewer) return;
    modal_scroll() = 0;
}

void Session::modal_bottom() {
    scroll_modal(static_cast<int>(modal_line_count()));
}

void Session::open_help() {
    modes_.open_help();
}

void Session::invalidate_unit_state() {
    properties_cache_.clear();
    logs_.reset();
    details_ = DetailsViewModel{};
    unit_file_ = UnitFileViewModel{};
}

void Session::toggle_scope() {
    const Scope scope = filter_.scope() == Scope::System ? Scope::User : Scope::System;
    spdlog::info("switching to {} scope", scope_label(scope));
    filter_.set_scope(scope);
    invalidate_unit_state();
    reload();
}

void Session::switch_category(UnitCategory category) {
    if (category == filter_.category()) return;
    spdlog::info("switching to {}", category_label(category));
    filter_.set_category(category);
    invalidate_unit_state();
    reload();
}

std::vector<SourceError> Session::recent_errors() {
    auto errors = unit_source_->get_recent_errors();
    auto log_errors = log_source_->get_recent_errors();
    errors.insert(errors.end(), log_errors.begin(), log_errors.end());
    std::stable_sort(errors.begin(), errors.end(), [](const SourceError& a, const SourceError& b) {
        return a.timestamp < b.timestamp;
    });
    return errors;
}

} // namespace svcdeck
