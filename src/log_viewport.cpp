#include "log_viewport.hpp"
#include "text_format.hpp"
#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>

namespace svcdeck {

LogViewport::LogViewport(ILogSource* source, size_t line_limit)
    : source_(source)
    , line_limit_(line_limit) {
}

void LogViewport::set_target(std::optional<std::string> unit, Scope scope) {
    target_ = std::move(unit);
    scope_ = scope;
}

void LogViewport::reset() {
    target_.reset();
    loaded_unit_.reset();
    records_.clear();
    markers_.clear();
    reset_continuity();
    clear_search();
    scroll_ = TrackLatest{};
    dirty_ = false;
}

void LogViewport::set_severity(std::optional<int> max_priority) {
    if (max_priority && (*max_priority < 0 || *max_priority > kMaxPriority)) {
        max_priority.reset();
    }
    if (max_priority == severity_) return;
    severity_ = max_priority;
    dirty_ = true;
}

void LogViewport::set_time_range(TimeRange range) {
    if (range == time_range_) return;
    time_range_ = range;
    dirty_ = true;
}

bool LogViewport::ensure_loaded() {
    if (!target_) {
        if (loaded_unit_ || !records_.empty()) {
            loaded_unit_.reset();
            records_.clear();
            markers_.clear();
            reset_continuity();
            clear_search();
            scroll_ = TrackLatest{};
        }
        return false;
    }

    if (!dirty_ && loaded_unit_ == target_ && loaded_scope_ == scope_) {
        return false;
    }

    load();
    return true;
}

void LogViewport::load() {
    records_.clear();
    markers_.clear();
    reset_continuity();
    clear_search();
    scroll_ = TrackLatest{};
    dirty_ = false;
    loaded_unit_ = target_;
    loaded_scope_ = scope_;
    next_tail_ = Clock::now() + tail_interval_;

    auto result = source_->fetch_recent(*target_, scope_, line_limit_, severity_, time_range_);
    if (!result.success) {
        spdlog::warn("log load for {} failed: {}", *target_, result.error_message);
        LogRecord error_record;
        error_record.message = std::format("Error fetching logs: {}", result.error_message);
        append({std::move(error_record)});
        return;
    }

    spdlog::debug("loaded {} log records for {}", result.records.size(), *target_);
    append(std::move(result.records));
}

size_t LogViewport::tail() {
    if (!loaded_unit_ || records_.empty()) return 0;

    const auto& cursor = records_.back().cursor;
    if (!cursor) return 0;

    auto result = source_->fetch_since(*loaded_unit_, *cursor, loaded_scope_, severity_, time_range_);
    if (!result.success) {
        spdlog::warn("log tail for {} failed: {}", *loaded_unit_, result.error_message);
        return 0;
    }

    const size_t count = result.records.size();
    if (count > 0) {
        spdlog::debug("tail appended {} records for {}", count, *loaded_unit_);
        append(std::move(result.records));
    }
    return count;
}

size_t LogViewport::poll_tail(Clock::time_point now) {
    if (!live_tail_ || !loaded_unit_ || now < next_tail_) return 0;
    next_tail_ = now + tail_interval_;
    return tail();
}

std::optional<LogViewport::Clock::time_point> LogViewport::next_tail_deadline() const {
    if (!live_tail_ || !loaded_unit_) return std::nullopt;
    return next_tail_;
}

void LogViewport::set_live_tail(bool enabled) {
    live_tail_ = enabled;
    if (enabled) {
        scroll_ = TrackLatest{};
        next_tail_ = Clock::now();
    }
}

void LogViewport::set_geometry(int rows, int columns) {
    rows_ = std::max(rows, 1);
    columns_ = std::max(columns, 1);
}

void LogViewport::append(std::vector<LogRecord> records) {
    records_.reserve(records_.size() + records.size());
    const std::string query = to_lower(search_query_);

    for (auto& record : records) {
        Discontinuity marker = records_.empty() ? Discontinuity::None : classify(record);
        track_continuity(record, marker);

        if (!query.empty() && contains_lower(record.message, query)) {
            matches_.push_back(records_.size());
        }
        records_.push_back(std::move(record));
        markers_.push_back(marker);
    }
}

void LogViewport::reset_continuity() {
    last_boot_id_.reset();
    last_invocation_id_.reset();
}

Discontinuity LogViewport::classify(const LogRecord& record) const {
    if (record.boot_id && last_boot_id_ && *record.boot_id != *last_boot_id_) {
        return Discontinuity::Reboot;
    }
    if (record.invocation_id && last_invocation_id_ && *record.invocation_id != *last_invocation_id_) {
        return Discontinuity::Restart;
    }
    return Discontinuity::None;
}

void LogViewport::track_continuity(const LogRecord& record, Discontinuity marker) {
    if (record.boot_id) {
        last_boot_id_ = record.boot_id;
    }
    if (marker == Discontinuity::Reboot) {
        // Invocation ids from the previous boot are meaningless now
        last_invocation_id_ = record.invocation_id;
    } else if (record.invocation_id) {
        last_invocation_id_ = record.invocation_id;
    }
}

Discontinuity LogViewport::marker_before(size_t index) const {
    if (index >= markers_.size()) return Discontinuity::None;
    return markers_[index];
}

int LogViewport::record_height(size_t index) const {
    if (index >= records_.size()) return 0;
    int height = wrapped_line_count(format_log_line(records_[index]), columns_);
    if (markers_[index] != Discontinuity::None) ++height;
    return height;
}

size_t LogViewport::resolve_bottom(size_t count, int viewport_rows,
                                   const std::function<int(size_t)>& height_of) {
    if (count == 0) return 0;

    int used = 0;
    for (size_t i = count; i-- > 0;) {
        used += height_of(i);
        if (used > viewport_rows) {
            return std::min(i + 1, count - 1);
        }
    }
    return 0;
}

size_t LogViewport::resolve_bottom(const std::vector<int>& heights, int viewport_rows) {
    return resolve_bottom(heights.size(), viewport_rows,
                          [&heights](size_t i) { return heights[i]; });
}

size_t LogViewport::bottom_index() const {
    return resolve_bottom(records_.size(), rows_,
                          [this](size_t i) { return record_height(i); });
}

size_t LogViewport::top_index() const {
    const size_t bottom = bottom_index();
    if (const auto* fixed = std::get_if<FixedScroll>(&scroll_)) {
        return std::min(fixed->index, bottom);
    }
    return bottom;
}

std::pair<size_t, size_t> LogViewport::visible_range() const {
    const size_t first = top_index();
    size_t end = first;
    int used = 0;
    while (end < records_.size()) {
        used += record_height(end);
        if (used > rows_ && end > first) break;
        ++end;
        if (used >= rows_) break;
    }
    return {first, end};
}

void LogViewport::scroll_up(size_t amount) {
    const size_t top = top_index();
    scroll_ = FixedScroll{top > amount ? top - amount : 0};
    live_tail_ = false;
}

void LogViewport::scroll_down(size_t amount) {
    const size_t top = top_index();
    scroll_ = FixedScroll{std::min(top + amount, bottom_index())};
    live_tail_ = false;
}

void LogViewport::go_to_top() {
    scroll_ = FixedScroll{0};
    live_tail_ = false;
}

void LogViewport::go_to_bottom() {
    scroll_ = TrackLatest{};
}

void LogViewport::set_search_query(std::string query) {
    search_query_ = std::move(query);
    recompute_matches();
    if (current_match_) {
        reveal(matches_[*current_match_]);
    }
}

void LogViewport::clear_search() {
    search_query_.clear();
    matches_.clear();
    current_match_.reset();
}

void LogViewport::recompute_matches() {
    matches_.clear();
    current_match_.reset();
    if (search_query_.empty()) return;

    const std::string query = to_lower(search_query_);
    for (size_t i = 0; i < records_.size(); ++i) {
        if (contains_lower(records_[i].message, query)) {
            matches_.push_back(i);
        }
    }
    if (!matches_.empty()) current_match_ = 0;
}

void LogViewport::next_match() {
    if (matches_.empty()) return;
    if (!current_match_) {
        current_match_ = 0;
    } else {
        current_match_ = (*current_match_ + 1) % matches_.size();
    }
    reveal(matches_[*current_match_]);
}

void LogViewport::previous_match() {
    if (matches_.empty()) return;
    if (!current_match_ || *current_match_ == 0) {
        current_match_ = matches_.size() - 1;
    } else {
        current_match_ = *current_match_ - 1;
    }
    reveal(matches_[*current_match_]);
}

bool LogViewport::is_current_match(size_t record_index) const {
    return current_match_ && matches_[*current_match_] == record_index;
}

void LogViewport::reveal(size_t record_index) {
    auto [first, end] = visible_range();
    if (record_index >= first && record_index < end) return;

    scroll_ = FixedScroll{std::min(record_index, bottom_index())};
    live_tail_ = false;
}

} // namespace svcdeck
