#include "doctest.h"

#include "action_orchestrator.hpp"
#include "fake_sources.hpp"
#include "logging.hpp"

#include <memory>
#include <spdlog/spdlog.h>

using namespace svcdeck;
using svcdeck::tests::ActionGate;
using svcdeck::tests::GatedUnitSource;

namespace {

// Logs from the worker thread once the gate opens
class LoggingUnitSource final : public IUnitSource {
public:
    explicit LoggingUnitSource(std::shared_ptr<ActionGate> gate) : inner_(gate) {}

    UnitListResult list_units(UnitCategory category, Scope scope) override {
        spdlog::debug("listing after action");
        return inner_.list_units(category, scope);
    }
    UnitProperties get_properties(const std::string& name, Scope scope) override {
        return inner_.get_properties(name, scope);
    }
    ActionResult run_action(UnitAction action, const std::string& name, Scope scope) override {
        auto result = inner_.run_action(action, name, scope);
        spdlog::info("action on {} finished", name);
        return result;
    }
    FileContentResult get_file_content(const std::string& name, Scope scope) override {
        return inner_.get_file_content(name, scope);
    }
    std::vector<SourceError> get_recent_errors() override { return {}; }

private:
    GatedUnitSource inner_;
};

} // namespace

TEST_CASE("logging: default path names a .log file") {
    CHECK(default_log_path().ends_with(".log"));
}

TEST_CASE("logging: a worker still running after shutdown_logging can log and be joined") {
    auto gate = std::make_shared<ActionGate>();
    {
        ActionOrchestrator actions([gate]() -> std::unique_ptr<IUnitSource> {
            return std::make_unique<LoggingUnitSource>(gate);
        });
        REQUIRE(actions.request(UnitAction::Restart, "nginx.service"));
        REQUIRE(actions.confirm(UnitCategory::Service, Scope::System));
        actions.dismiss();

        shutdown_logging();
        REQUIRE(spdlog::default_logger() != nullptr);

        gate->release();
        // Destruction joins the worker, which logs through the replacement logger
    }
    spdlog::info("logging after shutdown is harmless");
    CHECK(spdlog::default_logger() != nullptr);
}
