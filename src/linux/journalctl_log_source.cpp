#include "journalctl_log_source.hpp"
#include "journal_parser.hpp"
#include "process_runner.hpp"
#include <format>
#include <spdlog/spdlog.h>

namespace svcdeck {

std::vector<SourceError> JournalctlLogSource::get_recent_errors() {
    return errors_.recent();
}

std::vector<std::string> JournalctlLogSource::build_args(const std::string& unit, Scope scope,
                                                         const std::string& position_arg,
                                                         const std::string& position_value,
                                                         std::optional<int> max_priority, TimeRange range) {
    std::vector<std::string> argv = {"journalctl", scope == Scope::User ? "--user-unit" : "-u", unit};

    if (position_arg.starts_with("--")) {
        argv.push_back(std::format("{}={}", position_arg, position_value));
    } else {
        argv.push_back(position_arg);
        argv.push_back(position_value);
    }

    argv.emplace_back("--no-pager");
    argv.emplace_back("--output=json");

    if (max_priority) {
        argv.emplace_back("-p");
        argv.push_back(std::to_string(*max_priority));
    }
    if (const char* since = time_range_since(range)) {
        argv.emplace_back("--since");
        argv.emplace_back(since);
    }
    return argv;
}

LogFetchResult JournalctlLogSource::run(const std::vector<std::string>& argv, const std::string& unit) {
    LogFetchResult result;

    auto output = run_process(argv, kQueryTimeout);
    if (!output.started || output.timed_out) {
        result.error_message = describe_failure(output, "journalctl");
        errors_.add(std::format("{}: {}", unit, result.error_message));
        return result;
    }

    // journalctl exits non-zero for some harmless conditions; only fail when nothing came back
    if (output.exit_code != 0 && output.stdout_text.empty()) {
        result.error_message = describe_failure(output, "journalctl");
        errors_.add(std::format("{}: {}", unit, result.error_message));
        return result;
    }

    result.records = parse_journal_output(output.stdout_text);
    result.success = true;
    return result;
}

LogFetchResult JournalctlLogSource::fetch_recent(const std::string& unit, Scope scope, size_t limit,
                                                 std::optional<int> max_priority, TimeRange range) {
    return run(build_args(unit, scope, "-n", std::to_string(limit), max_priority, range), unit);
}

LogFetchResult JournalctlLogSource::fetch_since(const std::string& unit, const std::string& cursor, Scope scope,
                                                std::optional<int> max_priority, TimeRange range) {
    return run(build_args(unit, scope, "--after-cursor", cursor, max_priority, range), unit);
}

} // namespace svcdeck
