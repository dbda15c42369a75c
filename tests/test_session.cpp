#include "doctest.h"

#include "session.hpp"
#include "fake_sources.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace svcdeck;
using svcdeck::tests::ActionGate;
using svcdeck::tests::FakeLogSource;
using svcdeck::tests::FakeUnitSource;
using svcdeck::tests::GatedUnitSource;
using svcdeck::tests::make_record;
using svcdeck::tests::make_unit;

namespace {

// Owns a session wired to fakes while keeping handles on the fakes
struct SessionFixture {
    std::shared_ptr<ActionGate> gate = std::make_shared<ActionGate>();
    FakeUnitSource* units = nullptr;
    FakeLogSource* logs = nullptr;
    std::unique_ptr<Session> session;

    explicit SessionFixture(SessionConfig config = {}) {
        auto unit_source = std::make_unique<FakeUnitSource>();
        auto log_source = std::make_unique<FakeLogSource>();
        units = unit_source.get();
        logs = log_source.get();

        units->set_units(UnitCategory::Service, Scope::System, {
            make_unit("cron.service", "running", "Regular background program processing daemon", "enabled"),
            make_unit("nginx.service", "dead", "A high performance web server", "disabled"),
            make_unit("ssh.service", "running", "OpenBSD Secure Shell server", "enabled"),
        });
        units->set_units(UnitCategory::Timer, Scope::System, {
            make_unit("logrotate.timer", "waiting", "Daily rotation of log files", "enabled"),
        });
        units->set_units(UnitCategory::Service, Scope::User, {
            make_unit("pipewire.service", "running", "PipeWire Multimedia Service", "enabled"),
        });

        auto shared_gate = gate;
        session = std::make_unique<Session>(
            std::move(unit_source), std::move(log_source),
            [shared_gate]() -> std::unique_ptr<IUnitSource> {
                return std::make_unique<GatedUnitSource>(shared_gate);
            },
            config);
        session->start();
    }

    ~SessionFixture() {
        // Unblock any worker so the orchestrator can join it
        if (!released) gate->release();
    }

    void release() {
        gate->release();
        released = true;
    }

    bool tick_until(const std::function<bool()>& done) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            session->tick(Session::Clock::now());
            if (done()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return false;
    }

    bool released = false;
};

} // namespace

TEST_CASE("Session: start lists the initial inventory and selects the first unit") {
    SessionFixture f;
    CHECK(f.units->list_calls == 1);
    CHECK(f.session->units().units().size() == 3);
    REQUIRE(f.session->units().selected_unit() != nullptr);
    CHECK(f.session->units().selected_unit()->name == "cron.service");
    CHECK(f.session->mode() == Mode::Normal);
}

TEST_CASE("Session: a failed listing is kept as the fetch error") {
    SessionFixture f;
    f.units->inventories[{UnitCategory::Service, Scope::System}] = UnitListResult{false, {}, "Failed to connect to bus"};
    f.session->reload();

    REQUIRE(f.session->units().fetch_error().has_value());
    CHECK(*f.session->units().fetch_error() == "Failed to connect to bus");
}

TEST_CASE("Session: typing narrows the list live and Esc clears the query") {
    SessionFixture f;
    f.session->begin_search();
    CHECK(f.session->mode() == Mode::SearchTyping);

    for (char c : std::string("SSH")) f.session->type_char(c);
    CHECK(f.session->units().filtered_indices() == std::vector<size_t>{2});

    f.session->erase_char();
    f.session->erase_char();
    CHECK(f.session->units().search_query() == "S");

    f.session->finish_typing();
    CHECK(f.session->mode() == Mode::Normal);
    CHECK(f.session->units().search_query() == "S");

    f.session->escape();
    CHECK(f.session->units().search_query().empty());
    CHECK(f.session->units().filtered_indices().size() == 3);
}

TEST_CASE("Session: status picker applies the chosen sub-state") {
    SessionFixture f;
    f.session->open_status_picker();
    REQUIRE(f.session->mode() == Mode::StatusPicker);

    f.session->picker_next();  // running
    f.session->confirm_picker();
    CHECK(f.session->mode() == Mode::Normal);
    CHECK(f.session->units().sub_state_filter() == std::optional<std::string>("running"));
    CHECK(f.session->units().filtered_indices() == std::vector<size_t>{0, 2});

    // Reopening preselects the active value; "All" clears it
    f.session->open_status_picker();
    CHECK(f.session->modes().picker().current() == "running");
    f.session->picker_previous();
    f.session->confirm_picker();
    CHECK_FALSE(f.session->units().sub_state_filter().has_value());
}

TEST_CASE("Session: file state picker filters on enablement") {
    SessionFixture f;
    f.session->open_file_state_picker();
    f.session->picker_next();
    f.session->picker_next();  // disabled
    f.session->confirm_picker();
    CHECK(f.session->units().filtered_indices() == std::vector<size_t>{1});
}

TEST_CASE("Session: cancelling a picker changes nothing") {
    SessionFixture f;
    f.session->open_status_picker();
    f.session->picker_next();
    f.session->cancel();
    CHECK(f.session->mode() == Mode::Normal);
    CHECK_FALSE(f.session->units().sub_state_filter().has_value());
}

TEST_CASE("Session: category switch refetches and drops filters") {
    SessionFixture f;
    f.session->begin_search();
    f.session->type_char('c');
    f.session->finish_typing();

    f.session->open_category_picker();
    f.session->picker_next();  // Timer
    f.session->confirm_picker();

    CHECK(f.session->mode() == Mode::Normal);
    CHECK(f.session->units().category() == UnitCategory::Timer);
    CHECK(f.session->units().search_query().empty());
    REQUIRE(f.session->units().selected_unit() != nullptr);
    CHECK(f.session->units().selected_unit()->name == "logrotate.timer");
    CHECK(f.units->list_calls == 2);
}

TEST_CASE("Session: scope toggle lists the user manager") {
    SessionFixture f;
    f.session->toggle_scope();
    CHECK(f.session->units().scope() == Scope::User);
    REQUIRE(f.session->units().selected_unit() != nullptr);
    CHECK(f.session->units().selected_unit()->name == "pipewire.service");

    f.session->toggle_scope();
    CHECK(f.session->units().scope() == Scope::System);
}

TEST_CASE("Session: log focus loads logs for the selected unit and follows the selection") {
    SessionFixture f;
    f.logs->recent = LogFetchResult{true, {make_record("hello", "b", "i", std::string("c1"))}, {}};

    f.session->tick(Session::Clock::now());
    CHECK(f.logs->recent_calls.empty());

    f.session->toggle_log_focus();
    CHECK(f.session->log_focus());
    REQUIRE(f.logs->recent_calls.size() == 1);
    CHECK(f.logs->recent_calls[0].unit == "cron.service");
    CHECK(f.logs->recent_calls[0].limit == 1000);
    CHECK(f.session->logs().records().size() == 1);

    f.session->select_next();
    f.session->tick(Session::Clock::now());
    REQUIRE(f.logs->recent_calls.size() == 2);
    CHECK(f.logs->recent_calls[1].unit == "nginx.service");

    f.session->toggle_log_focus();
    CHECK_FALSE(f.session->log_focus());
}

TEST_CASE("Session: severity and time range pickers reload the logs") {
    SessionFixture f;
    f.session->toggle_log_focus();
    REQUIRE(f.logs->recent_calls.size() == 1);

    f.session->open_severity_picker();
    for (int i = 0; i < 4; ++i) f.session->picker_next();  // "3 err"
    f.session->confirm_picker();
    CHECK(f.session->logs().severity() == 3);

    f.session->open_time_range_picker();
    f.session->picker_next();
    f.session->confirm_picker();
    CHECK(f.session->logs().time_range() == TimeRange::FifteenMinutes);

    f.session->tick(Session::Clock::now());
    REQUIRE(f.logs->recent_calls.size() == 2);
    CHECK(f.logs->recent_calls[1].max_priority == 3);
    CHECK(f.logs->recent_calls[1].range == TimeRange::FifteenMinutes);
}

TEST_CASE("Session: log search typing and Esc in log focus") {
    SessionFixture f;
    f.logs->recent = LogFetchResult{true, {
        make_record("starting up"),
        make_record("listening on :80"),
        make_record("shutting down"),
    }, {}};
    f.session->toggle_log_focus();

    f.session->begin_search();
    CHECK(f.session->mode() == Mode::LogSearchTyping);
    for (char c : std::string("ing")) f.session->type_char(c);
    f.session->finish_typing();
    CHECK(f.session->logs().matches() == std::vector<size_t>{0, 1, 2});

    f.session->next_log_match();
    CHECK(f.session->logs().is_current_match(1));

    // First Esc clears the query, the second leaves log focus
    f.session->escape();
    CHECK(f.session->logs().search_query().empty());
    CHECK(f.session->log_focus());
    f.session->escape();
    CHECK_FALSE(f.session->log_focus());
}

TEST_CASE("Session: action flow from picker to settled result") {
    SessionFixture f;
    f.gate->result = ActionResult{true, "Restart succeeded for cron.service"};
    f.gate->inventory = UnitListResult{true, {
        make_unit("cron.service", "running"),
        make_unit("ssh.service", "running"),
    }, {}};

    f.session->open_action_picker();
    REQUIRE(f.session->mode() == Mode::ActionPicker);
    CHECK(f.session->modes().picker().current() == "Stop");
    f.session->picker_next();  // Restart
    f.session->confirm_picker();

    CHECK(f.session->mode() == Mode::ConfirmDialog);
    CHECK(f.session->actions().phase() == ActionPhase::Confirming);
    CHECK(f.session->actions().pending()->unit_name == "cron.service");

    f.session->confirm_action();
    CHECK(f.session->actions().phase() == ActionPhase::Executing);
    CHECK(f.session->next_wait(Session::Clock::now()) <= std::chrono::milliseconds(50));

    // Another action cannot be started meanwhile
    f.session->open_action_picker();
    CHECK(f.session->mode() == Mode::ConfirmDialog);

    f.release();
    REQUIRE(f.tick_until([&] { return f.session->actions().phase() == ActionPhase::Settled; }));
    CHECK(f.session->actions().result()->message == "Restart succeeded for cron.service");

    REQUIRE(f.tick_until([&] { return f.session->units().units().size() == 2; }));
    CHECK(f.session->units().selected_unit()->name == "cron.service");

    f.session->confirm_action();
    CHECK(f.session->actions().phase() == ActionPhase::Idle);
    CHECK(f.session->mode() == Mode::Normal);
}

TEST_CASE("Session: a refresh for another category is dropped") {
    SessionFixture f;
    f.gate->inventory = UnitListResult{true, {make_unit("stale.service", "running")}, {}};

    f.session->open_action_picker();
    f.session->confirm_picker();  // Stop
    f.session->confirm_action();
    REQUIRE(f.session->actions().phase() == ActionPhase::Executing);

    // Hide the dialog and move on to timers before the worker finishes
    f.session->cancel();
    CHECK(f.session->mode() == Mode::Normal);
    f.session->switch_category(UnitCategory::Timer);

    f.release();
    REQUIRE(f.tick_until([&] { return !f.session->actions().refresh_pending(); }));
    REQUIRE(f.session->units().units().size() == 1);
    CHECK(f.session->units().units()[0].name == "logrotate.timer");
    CHECK(f.session->actions().phase() == ActionPhase::Idle);
}

TEST_CASE("Session: daemon reload is the only action without a selection") {
    SessionFixture f;
    f.session->open_status_picker();
    for (int i = 0; i < 3; ++i) f.session->picker_next();  // failed
    f.session->confirm_picker();
    REQUIRE(f.session->units().selected_unit() == nullptr);

    f.session->open_action_picker();
    REQUIRE(f.session->mode() == Mode::ActionPicker);
    CHECK(f.session->modes().picker().options() == std::vector<std::string>{"Daemon Reload"});
    f.session->confirm_picker();
    CHECK(f.session->actions().pending()->unit_name.empty());
    f.session->dismiss_action();
    CHECK(f.session->mode() == Mode::Normal);
}

TEST_CASE("Session: details are fetched once and cached until the inventory changes") {
    SessionFixture f;
    UnitProperties props;
    props.description = "Regular background program processing daemon";
    props.active_state = "active";
    props.sub_state = "running";
    props.main_pid = 612;
    f.units->properties["cron.service"] = props;

    f.session->open_details();
    REQUIRE(f.session->mode() == Mode::DetailsModal);
    CHECK(f.session->details().unit_name == "cron.service");
    CHECK_FALSE(f.session->details().lines.empty());
    f.session->cancel();

    f.session->open_details();
    f.session->cancel();
    CHECK(f.units->properties_calls == 1);

    f.session->toggle_scope();
    f.session->toggle_scope();
    f.session->open_details();
    CHECK(f.units->properties_calls == 2);
}

TEST_CASE("Session: modal scrolling clamps to the content") {
    SessionFixture f;
    f.units->files["cron.service"] = FileContentResult{true, std::vector<std::string>(30, "line"), {}};

    ViewportGeometry geometry;
    geometry.details_rows = 10;
    f.session->set_geometry(geometry);

    f.session->open_unit_file();
    REQUIRE(f.session->mode() == Mode::UnitFileViewer);
    CHECK_FALSE(f.session->unit_file().is_error);

    f.session->scroll_modal(-5);
    CHECK(f.session->unit_file().scroll == 0);
    f.session->modal_page_down();
    CHECK(f.session->unit_file().scroll == 10);
    f.session->modal_bottom();
    CHECK(f.session->unit_file().scroll == 20);
    f.session->scroll_modal(3);
    CHECK(f.session->unit_file().scroll == 20);
    f.session->modal_top();
    CHECK(f.session->unit_file().scroll == 0);
}

TEST_CASE("Session: unreadable unit file shows the error") {
    SessionFixture f;
    f.session->select_next();
    f.session->open_unit_file();
    REQUIRE(f.session->mode() == Mode::UnitFileViewer);
    CHECK(f.session->unit_file().is_error);
    REQUIRE(f.session->unit_file().lines.size() == 1);
    CHECK(f.session->unit_file().lines[0] == "Error: No files found for nginx.service");
}

TEST_CASE("Session: help only opens from normal mode") {
    SessionFixture f;
    f.session->open_status_picker();
    f.session->open_help();
    CHECK(f.session->mode() == Mode::StatusPicker);
    f.session->cancel();

    f.session->open_help();
    CHECK(f.session->mode() == Mode::Help);
    f.session->cancel();
    CHECK(f.session->mode() == Mode::Normal);
}

TEST_CASE("Session: idle wait and tail deadline bound the input timeout") {
    SessionConfig config;
    config.idle_wait = std::chrono::milliseconds(1000);
    config.tail_interval = std::chrono::milliseconds(300);
    SessionFixture f(config);

    auto now = Session::Clock::now();
    CHECK(f.session->next_wait(now) == std::chrono::milliseconds(1000));

    f.logs->recent = LogFetchResult{true, {make_record("x", "b", "i", std::string("c"))}, {}};
    f.session->toggle_log_focus();
    CHECK(f.session->next_wait(Session::Clock::now()) <= std::chrono::milliseconds(300));
}

TEST_CASE("Session: paging uses the visible unit rows") {
    SessionFixture f;
    std::vector<Unit> many;
    for (int i = 0; i < 50; ++i) many.push_back(make_unit("u" + std::to_string(i) + ".service", "running"));
    f.units->set_units(UnitCategory::Service, Scope::System, many);
    f.session->reload();

    ViewportGeometry geometry;
    geometry.unit_list_rows = 12;
    f.session->set_geometry(geometry);

    f.session->page_down();
    CHECK(f.session->units().selected() == 12u);
    f.session->select_last();
    CHECK(f.session->units().selected() == 49u);
    f.session->page_up();
    CHECK(f.session->units().selected() == 37u);
    f.session->select_first();
    CHECK(f.session->units().selected() == 0u);
}
