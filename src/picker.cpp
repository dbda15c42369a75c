#include "picker.hpp"
#include <algorithm>
#include <format>
#include <utility>

namespace svcdeck {

bool is_picker_mode(Mode mode) {
    switch (mode) {
        case Mode::StatusPicker:
        case Mode::CategoryPicker:
        case Mode::SeverityPicker:
        case Mode::TimeRangePicker:
        case Mode::FileStatePicker:
        case Mode::ActionPicker:
            return true;
        default:
            return false;
    }
}

bool is_typing_mode(Mode mode) {
    return mode == Mode::SearchTyping || mode == Mode::LogSearchTyping;
}

Picker::Picker(std::string title, std::vector<std::string> options, size_t initial)
    : title_(std::move(title))
    , options_(std::move(options))
    , cursor_(initial < options_.size() ? initial : 0) {
}

void Picker::next() {
    if (options_.empty()) return;
    cursor_ = (cursor_ + 1) % options_.size();
}

void Picker::previous() {
    if (options_.empty()) return;
    cursor_ = cursor_ == 0 ? options_.size() - 1 : cursor_ - 1;
}

const std::string& Picker::current() const {
    static const std::string empty;
    if (options_.empty()) return empty;
    return options_[cursor_];
}

namespace {

size_t index_of(const std::vector<std::string>& options, const std::optional<std::string>& value) {
    if (!value) return 0;
    auto it = std::ranges::find(options, *value);
    return it == options.end() ? 0 : static_cast<size_t>(it - options.begin());
}

} // namespace

Picker make_status_picker(UnitCategory category, const std::optional<std::string>& active) {
    const auto& options = status_options(category);
    return Picker("Filter by status", options, index_of(options, active));
}

Picker make_category_picker(UnitCategory active) {
    std::vector<std::string> options;
    size_t initial = 0;
    for (size_t i = 0; i < kUnitCategories.size(); ++i) {
        options.emplace_back(category_label(kUnitCategories[i]));
        if (kUnitCategories[i] == active) initial = i;
    }
    return Picker("Unit type", std::move(options), initial);
}

Picker make_severity_picker(std::optional<int> active) {
    std::vector<std::string> options = {"All"};
    for (int p = 0; p <= kMaxPriority; ++p) {
        options.push_back(std::format("{} {}", p, priority_label(p)));
    }
    size_t initial = 0;
    if (active && *active >= 0 && *active <= kMaxPriority) {
        initial = static_cast<size_t>(*active) + 1;
    }
    return Picker("Minimum severity", std::move(options), initial);
}

Picker make_time_range_picker(TimeRange active) {
    std::vector<std::string> options;
    size_t initial = 0;
    for (size_t i = 0; i < kTimeRanges.size(); ++i) {
        options.emplace_back(time_range_label(kTimeRanges[i]));
        if (kTimeRanges[i] == active) initial = i;
    }
    return Picker("Time range", std::move(options), initial);
}

Picker make_file_state_picker(const std::optional<std::string>& active) {
    return Picker("Filter by file state", kFileStateOptions, index_of(kFileStateOptions, active));
}

Picker make_action_picker(const std::vector<UnitAction>& actions, const std::string& unit_name) {
    std::vector<std::string> options;
    options.reserve(actions.size());
    for (auto action : actions) {
        options.emplace_back(action_label(action));
    }
    std::string title = unit_name.empty() ? std::string("Actions") : std::format("Actions: {}", unit_name);
    return Picker(std::move(title), std::move(options), 0);
}

std::optional<std::string> option_filter_value(const Picker& picker) {
    if (picker.empty() || picker.cursor() == 0) return std::nullopt;
    return picker.current();
}

std::optional<int> severity_from_cursor(size_t cursor) {
    if (cursor == 0 || cursor > static_cast<size_t>(kMaxPriority) + 1) return std::nullopt;
    return static_cast<int>(cursor) - 1;
}

bool ModeController::enter(Mode mode) {
    const bool handover = mode_ == Mode::ActionPicker && mode == Mode::ConfirmDialog;
    if (mode_ != Mode::Normal && !handover) return false;
    mode_ = mode;
    return true;
}

bool ModeController::open_picker(Mode mode, Picker picker) {
    if (!is_picker_mode(mode) || mode_ != Mode::Normal) return false;
    picker_ = std::move(picker);
    mode_ = mode;
    return true;
}

void ModeController::close() {
    mode_ = Mode::Normal;
    picker_ = Picker();
}

bool ModeController::open_help() {
    if (mode_ != Mode::Normal) return false;
    mode_ = Mode::Help;
    return true;
}

} // namespace svcdeck
