#include "logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>
#include <system_error>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace svcdeck {

namespace {

std::string fallback_log_path() {
    return std::format("/tmp/svcdeck-{}.log", getuid());
}

bool install_file_logger(const std::string& path) {
    try {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        auto logger = std::make_shared<spdlog::logger>("svcdeck", file_sink);

        const char* debug_env = std::getenv("SVCDECK_DEBUG");
        logger->set_level(debug_env && *debug_env ? spdlog::level::debug : spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return true;
    } catch (const spdlog::spdlog_ex&) {
        return false;
    }
}

} // namespace

std::string default_log_path() {
    if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state) {
        return std::format("{}/svcdeck/svcdeck.log", state);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::format("{}/.local/state/svcdeck/svcdeck.log", home);
    }
    return fallback_log_path();
}

void init_logging() {
    const std::string path = default_log_path();
    if (install_file_logger(path)) {
        spdlog::info("svcdeck started, logging to {}", path);
        return;
    }

    const std::string fallback = fallback_log_path();
    if (install_file_logger(fallback)) {
        spdlog::warn("cannot open {}, logging to {}", path, fallback);
        return;
    }

    // No writable location: keep the console quiet rather than corrupt the screen
    spdlog::set_level(spdlog::level::off);
}

void shutdown_logging() {
    auto file_logger = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("svcdeck"));
    if (file_logger) {
        file_logger->flush();
    }
}

} // namespace svcdeck
