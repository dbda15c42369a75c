#include "action_orchestrator.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace svcdeck {

const char* phase_label(ActionPhase phase) {
    switch (phase) {
        case ActionPhase::Idle:       return "idle";
        case ActionPhase::Confirming: return "confirming";
        case ActionPhase::Executing:  return "executing";
        case ActionPhase::Settled:    return "settled";
    }
    return "?";
}

ActionOrchestrator::ActionOrchestrator(UnitSourceFactory factory)
    : factory_(std::move(factory)) {
}

ActionOrchestrator::~ActionOrchestrator() {
    // Workers always finish: every external command runs under a timeout
    for (auto& worker : workers_) {
        if (!worker.thread.joinable()) continue;
        if (!*worker.done) {
            spdlog::info("waiting for running action worker to finish");
        }
        worker.thread.join();
    }
}

bool ActionOrchestrator::has_running_worker() const {
    return std::any_of(workers_.begin(), workers_.end(),
                       [](const Worker& worker) { return !*worker.done; });
}

void ActionOrchestrator::set_on_phase_changed(std::function<void(ActionPhase)> callback) {
    on_phase_changed_ = std::move(callback);
}

void ActionOrchestrator::set_phase(ActionPhase phase) {
    if (phase == phase_) return;
    spdlog::info("action {} -> {}", phase_label(phase_), phase_label(phase));
    phase_ = phase;
    if (on_phase_changed_) {
        on_phase_changed_(phase_);
    }
}

bool ActionOrchestrator::request(UnitAction action, std::string unit_name) {
    if (phase_ != ActionPhase::Idle) return false;

    if (is_host_wide(action)) unit_name.clear();
    pending_ = PendingAction{action, std::move(unit_name)};
    result_.reset();
    set_phase(ActionPhase::Confirming);
    return true;
}

bool ActionOrchestrator::confirm(UnitCategory category, Scope scope) {
    if (phase_ != ActionPhase::Confirming || !pending_) return false;

    reap_workers();

    std::promise<ActionResult> result_promise;
    std::promise<InventoryRefresh> refresh_promise;
    result_future_ = result_promise.get_future();
    refresh_future_ = refresh_promise.get_future();

    auto done = std::make_shared<std::atomic<bool>>(false);
    const PendingAction job = *pending_;

    std::thread thread([factory = factory_, job, category, scope, done,
                        result_promise = std::move(result_promise),
                        refresh_promise = std::move(refresh_promise)]() mutable {
        bool action_delivered = false;
        try {
            auto source = factory();
            if (!source) throw std::runtime_error("unit source unavailable");

            result_promise.set_value(source->run_action(job.action, job.unit_name, scope));
            action_delivered = true;
            refresh_promise.set_value(InventoryRefresh{category, scope, source->list_units(category, scope)});
        } catch (const std::exception& e) {
            spdlog::error("action worker failed: {}", e.what());
            if (!action_delivered) {
                result_promise.set_value(ActionResult{false, e.what()});
            }
            refresh_promise.set_value(InventoryRefresh{category, scope, UnitListResult{false, {}, e.what()}});
        }
        *done = true;
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});

    executing_since_ = Clock::now();
    set_phase(ActionPhase::Executing);
    return true;
}

void ActionOrchestrator::poll() {
    if (phase_ != ActionPhase::Executing || !result_future_.valid()) return;
    if (result_future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return;

    result_ = result_future_.get();
    if (result_->success) {
        spdlog::info("{}", result_->message);
    } else {
        spdlog::warn("{}", result_->message);
    }
    set_phase(ActionPhase::Settled);
}

std::optional<InventoryRefresh> ActionOrchestrator::take_refresh() {
    if (!refresh_future_.valid()) return std::nullopt;
    if (refresh_future_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return std::nullopt;
    return refresh_future_.get();
}

void ActionOrchestrator::dismiss() {
    if (phase_ == ActionPhase::Idle) return;

    if (phase_ == ActionPhase::Executing) {
        spdlog::info("abandoning result of {} {}", action_verb(pending_->action), pending_->unit_name);
    }

    pending_.reset();
    result_.reset();
    result_future_ = std::future<ActionResult>();
    set_phase(ActionPhase::Idle);
}

void ActionOrchestrator::reap_workers() {
    std::erase_if(workers_, [](Worker& worker) {
        if (!*worker.done) return false;
        if (worker.thread.joinable()) worker.thread.join();
        return true;
    });
}

} // namespace svcdeck
