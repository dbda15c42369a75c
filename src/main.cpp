#include "logging.hpp"
#include "platform_factory.hpp"
#include "session.hpp"
#include "tui/tui_app.hpp"
#include <clocale>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    // UTF-8 journal text and markers need the user's locale before initscr
    std::setlocale(LC_ALL, "");
    svcdeck::init_logging();

    int status = 0;
    try {
        // Create platform-specific sources (owned by the session)
        auto unit_source = svcdeck::make_unit_source();
        auto log_source = svcdeck::make_log_source();

        svcdeck::Session session(std::move(unit_source), std::move(log_source),
                                 [] { return svcdeck::make_action_unit_source(); });

        // TuiApp does not own the session - it's managed here
        svcdeck::TuiApp app(&session);
        app.run();

        // The session joins action workers on destruction
        if (session.actions().has_running_worker()) {
            std::cerr << "Waiting for a running systemctl action to finish..." << std::endl;
        }
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        endwin();
        spdlog::critical("fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    svcdeck::shutdown_logging();
    return status;
}
