#pragma once

#include "unit_info.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace svcdeck {

// Exclusive UI modes. Normal covers both non-modal focus states
// (unit list and log panel); the focus itself is tracked separately.
enum class Mode {
    Normal,
    SearchTyping,
    LogSearchTyping,
    StatusPicker,
    CategoryPicker,
    SeverityPicker,
    TimeRangePicker,
    FileStatePicker,
    ActionPicker,
    ConfirmDialog,
    DetailsModal,
    UnitFileViewer,
    Help
};

bool is_picker_mode(Mode mode);
bool is_typing_mode(Mode mode);

// Cyclic cursor over a fixed list of option labels
class Picker {
public:
    Picker() = default;
    Picker(std::string title, std::vector<std::string> options, size_t initial = 0);

    void next();
    void previous();

    const std::string& title() const { return title_; }
    const std::vector<std::string>& options() const { return options_; }
    size_t cursor() const { return cursor_; }
    bool empty() const { return options_.empty(); }
    [[nodiscard]] const std::string& current() const;

private:
    std::string title_;
    std::vector<std::string> options_;
    size_t cursor_ = 0;
};

// Pickers preselecting the entry that matches the current state
Picker make_status_picker(UnitCategory category, const std::optional<std::string>& active);
Picker make_category_picker(UnitCategory active);
Picker make_severity_picker(std::optional<int> active);
Picker make_time_range_picker(TimeRange active);
Picker make_file_state_picker(const std::optional<std::string>& active);
Picker make_action_picker(const std::vector<UnitAction>& actions, const std::string& unit_name);

// Decoding a picker cursor back to a filter value. Position 0 is "All".
std::optional<std::string> option_filter_value(const Picker& picker);
std::optional<int> severity_from_cursor(size_t cursor);

// Tracks the single active mode and the picker it owns. Modes are mutually
// exclusive: a new one can only be entered from Normal, except that the
// action picker hands over to the confirm dialog.
class ModeController {
public:
    Mode mode() const { return mode_; }
    bool is_normal() const { return mode_ == Mode::Normal; }

    // Non-modal focus: unit list (false) or log panel (true)
    bool log_focus() const { return log_focus_; }
    void set_log_focus(bool focused) { log_focus_ = focused; }

    // Returns false when another mode is active
    bool enter(Mode mode);
    bool open_picker(Mode mode, Picker picker);
    void close();

    // Help opens only from Normal; the key after it is swallowed
    bool open_help();

    Picker& picker() { return picker_; }
    const Picker& picker() const { return picker_; }

private:
    Mode mode_ = Mode::Normal;
    bool log_focus_ = false;
    Picker picker_;
};

} // namespace svcdeck
