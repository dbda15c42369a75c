#pragma once

#include "action_orchestrator.hpp"
#include "interfaces/i_log_source.hpp"
#include "interfaces/i_unit_source.hpp"
#include "log_viewport.hpp"
#include "picker.hpp"
#include "session_config.hpp"
#include "unit_filter.hpp"
#include "viewmodels/details_view_model.hpp"
#include "viewmodels/unit_file_view_model.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace svcdeck {

// Visible line counts supplied by the presentation layer once per frame
struct ViewportGeometry {
    int unit_list_rows = 20;
    int log_rows = 20;
    int log_columns = 80;
    int details_rows = 20;
};

// The whole interactive state of one run. Owned by the main loop; every
// mutation goes through one of the entry points below, each of which maps to
// a single logical key action.
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(std::unique_ptr<IUnitSource> unit_source,
            std::unique_ptr<ILogSource> log_source,
            UnitSourceFactory worker_source_factory,
            SessionConfig config = {});

    // Initial inventory fetch
    void start();

    // Refetch the inventory for the current category and scope, keeping filters
    void reload();

    void set_geometry(const ViewportGeometry& geometry);
    const ViewportGeometry& geometry() const { return geometry_; }

    // Advance background work: settle actions, apply refreshes, load and tail logs
    void tick(Clock::time_point now);

    // How long the main loop may block waiting for input
    [[nodiscard]] std::chrono::milliseconds next_wait(Clock::time_point now) const;

    // Progress indicator phase while an action executes
    [[nodiscard]] bool blink_on(Clock::time_point now) const;

    // Unit list navigation
    void select_next();
    void select_previous();
    void select_first();
    void select_last();
    void page_up();
    void page_down();
    void select_position(size_t filtered_pos);

    // Focus
    void toggle_log_focus();
    bool log_focus() const { return modes_.log_focus(); }

    // Typing modes
    void begin_search();
    void type_char(char c);
    void erase_char();
    void finish_typing();

    // Esc in a non-modal state: clears the active query first, then leaves log focus
    void escape();

    // Log panel
    void scroll_logs_up(size_t lines);
    void scroll_logs_down(size_t lines);
    void log_page_up();
    void log_page_down();
    void log_half_page_up();
    void log_half_page_down();
    void logs_top();
    void logs_bottom();
    void toggle_live_tail();
    void next_log_match();
    void previous_log_match();

    // Pickers
    void open_status_picker();
    void open_category_picker();
    void open_severity_picker();
    void open_time_range_picker();
    void open_file_state_picker();
    void open_action_picker();
    void picker_next();
    void picker_previous();
    void confirm_picker();

    // Leave the current overlay without effect
    void cancel();

    // Confirm dialog
    void confirm_action();
    void dismiss_action();

    // Details modal and unit-file viewer share the scroll entry points
    void open_details();
    void open_unit_file();
    void scroll_modal(int delta);
    void modal_page_up();
    void modal_page_down();
    void modal_top();
    void modal_bottom();

    void open_help();

    void toggle_scope();
    void switch_category(UnitCategory category);

    void request_quit() { quit_requested_ = true; }
    bool quit_requested() const { return quit_requested_; }

    // Read-only views for rendering
    const UnitFilter& units() const { return filter_; }
    const LogViewport& logs() const { return logs_; }
    const ModeController& modes() const { return modes_; }
    Mode mode() const { return modes_.mode(); }
    const ActionOrchestrator& actions() const { return actions_; }
    const DetailsViewModel& details() const { return details_; }
    const UnitFileViewModel& unit_file() const { return unit_file_; }
    const SessionConfig& config() const { return config_; }
    [[nodiscard]] std::vector<SourceError> recent_errors();

private:
    void apply_refresh(InventoryRefresh refresh);
    void sync_log_target();
    const UnitProperties& properties_for(const std::string& unit_name);
    size_t modal_line_count() const;
    size_t& modal_scroll();
    void invalidate_unit_state();

    SessionConfig config_;
    std::unique_ptr<IUnitSource> unit_source_;
    std::unique_ptr<ILogSource> log_source_;

    UnitFilter filter_;
    LogViewport logs_;
    ModeController modes_;
    ActionOrchestrator actions_;

    std::vector<UnitAction> action_choices_;
    std::map<std::string, UnitProperties> properties_cache_;
    DetailsViewModel details_;
    UnitFileViewModel unit_file_;

    ViewportGeometry geometry_;
    bool quit_requested_ = false;
};

} // namespace svcdeck
