#pragma once

#include "interfaces/i_log_source.hpp"
#include "interfaces/i_unit_source.hpp"

#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace svcdeck::tests {

inline Unit make_unit(std::string name, std::string sub_state, std::string description = {},
                      std::optional<std::string> file_state = std::nullopt) {
    Unit unit;
    unit.name = std::move(name);
    unit.load_state = "loaded";
    unit.active_state = sub_state == "dead" ? "inactive" : (sub_state == "failed" ? "failed" : "active");
    unit.sub_state = std::move(sub_state);
    unit.description = std::move(description);
    unit.file_state = std::move(file_state);
    return unit;
}

inline LogRecord make_record(std::string message,
                             std::optional<std::string> boot_id = std::nullopt,
                             std::optional<std::string> invocation_id = std::nullopt,
                             std::optional<std::string> cursor = std::nullopt) {
    LogRecord record;
    record.message = std::move(message);
    record.boot_id = std::move(boot_id);
    record.invocation_id = std::move(invocation_id);
    record.cursor = std::move(cursor);
    return record;
}

// Scripted inventory. Unknown category/scope pairs list as empty.
class FakeUnitSource final : public IUnitSource {
public:
    std::map<std::pair<UnitCategory, Scope>, UnitListResult> inventories;
    std::map<std::string, UnitProperties> properties;
    std::map<std::string, FileContentResult> files;
    ActionResult action_result{true, "ok"};

    int list_calls = 0;
    int properties_calls = 0;
    std::vector<std::pair<UnitAction, std::string>> actions_run;

    void set_units(UnitCategory category, Scope scope, std::vector<Unit> units) {
        inventories[{category, scope}] = UnitListResult{true, std::move(units), {}};
    }

    UnitListResult list_units(UnitCategory category, Scope scope) override {
        ++list_calls;
        auto it = inventories.find({category, scope});
        if (it == inventories.end()) return UnitListResult{true, {}, {}};
        return it->second;
    }

    UnitProperties get_properties(const std::string& name, Scope) override {
        ++properties_calls;
        auto it = properties.find(name);
        return it == properties.end() ? UnitProperties{} : it->second;
    }

    ActionResult run_action(UnitAction action, const std::string& name, Scope) override {
        actions_run.emplace_back(action, name);
        return action_result;
    }

    FileContentResult get_file_content(const std::string& name, Scope) override {
        auto it = files.find(name);
        if (it == files.end()) return FileContentResult{false, {}, "No files found for " + name};
        return it->second;
    }

    std::vector<SourceError> get_recent_errors() override { return {}; }
};

// Shared between the test and every source a worker factory creates.
// run_action blocks until release() is called.
struct ActionGate {
    std::promise<void> release_promise;
    std::shared_future<void> released = release_promise.get_future().share();

    std::mutex mutex;
    std::vector<std::pair<UnitAction, std::string>> actions_run;
    ActionResult result{true, "ok"};
    UnitListResult inventory{true, {}, {}};

    void release() { release_promise.set_value(); }
};

class GatedUnitSource final : public IUnitSource {
public:
    explicit GatedUnitSource(std::shared_ptr<ActionGate> gate) : gate_(std::move(gate)) {}

    UnitListResult list_units(UnitCategory, Scope) override {
        std::lock_guard<std::mutex> lock(gate_->mutex);
        return gate_->inventory;
    }

    UnitProperties get_properties(const std::string&, Scope) override { return {}; }

    ActionResult run_action(UnitAction action, const std::string& name, Scope) override {
        {
            std::lock_guard<std::mutex> lock(gate_->mutex);
            gate_->actions_run.emplace_back(action, name);
        }
        gate_->released.wait();
        std::lock_guard<std::mutex> lock(gate_->mutex);
        return gate_->result;
    }

    FileContentResult get_file_content(const std::string&, Scope) override { return {}; }
    std::vector<SourceError> get_recent_errors() override { return {}; }

private:
    std::shared_ptr<ActionGate> gate_;
};

// Scripted journal. fetch_since pops the next queued batch (empty when none).
class FakeLogSource final : public ILogSource {
public:
    LogFetchResult recent{true, {}, {}};
    std::deque<LogFetchResult> tail_batches;

    struct RecentCall {
        std::string unit;
        Scope scope;
        size_t limit;
        std::optional<int> max_priority;
        TimeRange range;
    };
    std::vector<RecentCall> recent_calls;
    std::vector<std::string> since_cursors;

    LogFetchResult fetch_recent(const std::string& unit, Scope scope, size_t limit,
                                std::optional<int> max_priority, TimeRange range) override {
        recent_calls.push_back(RecentCall{unit, scope, limit, max_priority, range});
        return recent;
    }

    LogFetchResult fetch_since(const std::string&, const std::string& cursor, Scope,
                               std::optional<int>, TimeRange) override {
        since_cursors.push_back(cursor);
        if (tail_batches.empty()) return LogFetchResult{true, {}, {}};
        LogFetchResult batch = std::move(tail_batches.front());
        tail_batches.pop_front();
        return batch;
    }

    std::vector<SourceError> get_recent_errors() override { return {}; }
};

} // namespace svcdeck::tests
