#pragma once

#include "interfaces/i_log_source.hpp"
#include "unit_info.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace svcdeck {

// Scroll anchor: either a fixed top record or pinned to the newest content
struct FixedScroll {
    size_t index = 0;
};
struct TrackLatest {};
using ScrollAnchor = std::variant<FixedScroll, TrackLatest>;

// Break rendered between two adjacent records
enum class Discontinuity {
    None,
    Reboot,   // boot id changed
    Restart   // invocation id changed within the same boot
};

// Log buffer for the selected unit: loading, live tailing, continuity markers,
// scroll resolution against wrapped rendering and in-buffer search.
class LogViewport {
public:
    using Clock = std::chrono::steady_clock;

    // Non-owning: source must outlive the viewport
    LogViewport(ILogSource* source, size_t line_limit);

    // Which unit to show. A different unit (or scope) forces a reload.
    void set_target(std::optional<std::string> unit, Scope scope);
    const std::optional<std::string>& target() const { return target_; }

    // Drops everything, e.g. after a category or scope switch
    void reset();

    // Log filters; a change marks the buffer dirty
    void set_severity(std::optional<int> max_priority);
    void set_time_range(TimeRange range);
    std::optional<int> severity() const { return severity_; }
    TimeRange time_range() const { return time_range_; }
    bool is_dirty() const { return dirty_; }

    // Fetches the most recent records if the target changed or the buffer is
    // dirty. Returns true when a load happened.
    bool ensure_loaded();

    // Fetches records after the last cursor and appends them. Returns the
    // number of appended records.
    size_t tail();

    // Runs tail() when live tail is on and the interval elapsed
    size_t poll_tail(Clock::time_point now);
    [[nodiscard]] std::optional<Clock::time_point> next_tail_deadline() const;
    void set_tail_interval(std::chrono::milliseconds interval) { tail_interval_ = interval; }

    bool live_tail() const { return live_tail_; }
    void set_live_tail(bool enabled);
    void toggle_live_tail() { set_live_tail(!live_tail_); }

    // Visible rows and wrap width of the log panel, supplied once per frame
    void set_geometry(int rows, int columns);
    int rows() const { return rows_; }
    int columns() const { return columns_; }

    // Manual scrolling, in records. Clears live tail.
    void scroll_up(size_t amount);
    void scroll_down(size_t amount);
    void go_to_top();
    void go_to_bottom();

    const ScrollAnchor& scroll() const { return scroll_; }
    bool is_tracking_latest() const { return std::holds_alternative<TrackLatest>(scroll_); }

    // Smallest index whose suffix fits the panel
    [[nodiscard]] size_t bottom_index() const;

    // First visible record after resolving the anchor
    [[nodiscard]] size_t top_index() const;

    // [first, end) of the records that fit the panel from top_index()
    [[nodiscard]] std::pair<size_t, size_t> visible_range() const;

    // Search over message text
    void set_search_query(std::string query);
    void clear_search();
    void next_match();
    void previous_match();
    const std::string& search_query() const { return search_query_; }
    const std::vector<size_t>& matches() const { return matches_; }
    std::optional<size_t> current_match() const { return current_match_; }
    [[nodiscard]] bool is_current_match(size_t record_index) const;

    const std::vector<LogRecord>& records() const { return records_; }
    [[nodiscard]] Discontinuity marker_before(size_t index) const;

    // Visual lines the record occupies at the current width, marker included
    [[nodiscard]] int record_height(size_t index) const;

    // Scans heights backward from the end: the smallest i such that heights
    // i..end sum to at most viewport_rows. If the last record alone is taller
    // than the viewport, that record's index.
    static size_t resolve_bottom(size_t count, int viewport_rows,
                                 const std::function<int(size_t)>& height_of);
    static size_t resolve_bottom(const std::vector<int>& heights, int viewport_rows);

private:
    void load();
    void append(std::vector<LogRecord> records);
    void reset_continuity();
    Discontinuity classify(const LogRecord& record) const;
    void track_continuity(const LogRecord& record, Discontinuity marker);
    void recompute_matches();
    void reveal(size_t record_index);

    ILogSource* source_ = nullptr;
    size_t line_limit_;

    std::optional<std::string> target_;
    Scope scope_ = Scope::System;
    std::optional<std::string> loaded_unit_;
    Scope loaded_scope_ = Scope::System;

    std::optional<int> severity_;
    TimeRange time_range_ = TimeRange::All;
    bool dirty_ = false;

    std::vector<LogRecord> records_;
    std::vector<Discontinuity> markers_;  // parallel to records_
    std::optional<std::string> last_boot_id_;
    std::optional<std::string> last_invocation_id_;

    ScrollAnchor scroll_ = TrackLatest{};
    bool live_tail_ = true;
    std::chrono::milliseconds tail_interval_{2000};
    Clock::time_point next_tail_{};

    std::string search_query_;
    std::vector<size_t> matches_;
    std::optional<size_t> current_match_;  // position in matches_

    int rows_ = 20;
    int columns_ = 80;
};

} // namespace svcdeck
