#pragma once

#include "interfaces/i_unit_source.hpp"
#include "unit_info.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace svcdeck {

enum class ActionPhase {
    Idle,
    Confirming,
    Executing,
    Settled
};

const char* phase_label(ActionPhase phase);

struct PendingAction {
    UnitAction action = UnitAction::Start;
    std::string unit_name;  // empty for host-wide actions
};

// Inventory fetched by the worker after the action finished, tagged with the
// category and scope it was fetched for
struct InventoryRefresh {
    UnitCategory category = UnitCategory::Service;
    Scope scope = Scope::System;
    UnitListResult result;
};

// Creates a unit source for a worker thread. Each worker gets its own instance.
using UnitSourceFactory = std::function<std::unique_ptr<IUnitSource>()>;

// Runs one unit action at a time off the UI thread.
// idle -> confirming -> executing -> settled -> idle
// The action result and the follow-up inventory refresh arrive over two
// separate one-shot channels which poll() checks without blocking.
class ActionOrchestrator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ActionOrchestrator(UnitSourceFactory factory);
    ~ActionOrchestrator();

    ActionOrchestrator(const ActionOrchestrator&) = delete;
    ActionOrchestrator& operator=(const ActionOrchestrator&) = delete;

    // idle -> confirming. Ignored (returns false) while another action is pending.
    bool request(UnitAction action, std::string unit_name);

    // confirming -> executing. Starts the worker and returns immediately.
    bool confirm(UnitCategory category, Scope scope);

    // executing -> settled once the result is available. Never blocks.
    void poll();

    // The post-action inventory, once. Empty until the worker delivers it.
    [[nodiscard]] std::optional<InventoryRefresh> take_refresh();
    bool refresh_pending() const { return refresh_future_.valid(); }

    // Clears all pending-action fields. While executing, the result channel is
    // abandoned and a late result is discarded.
    void dismiss();

    ActionPhase phase() const { return phase_; }
    const std::optional<PendingAction>& pending() const { return pending_; }
    const std::optional<ActionResult>& result() const { return result_; }
    Clock::time_point executing_since() const { return executing_since_; }

    // True while any worker, including one whose result was dismissed, is still running
    [[nodiscard]] bool has_running_worker() const;

    // Called on the UI thread after every phase change
    void set_on_phase_changed(std::function<void(ActionPhase)> callback);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void set_phase(ActionPhase phase);
    void reap_workers();

    UnitSourceFactory factory_;

    ActionPhase phase_ = ActionPhase::Idle;
    std::optional<PendingAction> pending_;
    std::optional<ActionResult> result_;
    Clock::time_point executing_since_{};

    std::future<ActionResult> result_future_;
    std::future<InventoryRefresh> refresh_future_;

    std::vector<Worker> workers_;
    std::function<void(ActionPhase)> on_phase_changed_;
};

} // namespace svcdeck
