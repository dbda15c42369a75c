#include "systemctl_unit_source.hpp"
#include "process_runner.hpp"
#include "systemctl_parser.hpp"
#include "../text_format.hpp"
#include <format>
#include <spdlog/spdlog.h>

namespace svcdeck {

std::vector<SourceError> SystemctlUnitSource::get_recent_errors() {
    return errors_.recent();
}

std::vector<std::string> SystemctlUnitSource::base_args(Scope scope) {
    std::vector<std::string> argv = {"systemctl"};
    if (scope == Scope::User) {
        argv.emplace_back("--user");
    }
    return argv;
}

std::string SystemctlUnitSource::run_optional_query(std::vector<std::string> argv, const char* what) {
    auto output = run_process(argv, kQueryTimeout);
    if (!output.ok()) {
        errors_.add(std::format("{}: {}", what, describe_failure(output, "systemctl")));
        return {};
    }
    return std::move(output.stdout_text);
}

UnitListResult SystemctlUnitSource::list_units(UnitCategory category, Scope scope) {
    UnitListResult result;
    const std::string type_arg = std::format("--type={}", category_type_arg(category));

    auto argv = base_args(scope);
    argv.insert(argv.end(), {"list-units", type_arg, "--all", "--no-pager", "--output=json"});

    auto output = run_process(argv, kQueryTimeout);
    if (!output.ok()) {
        result.error_message = std::format("systemctl failed: {}", describe_failure(output, "systemctl"));
        return result;
    }

    auto parsed = parse_list_units(output.stdout_text);
    if (!parsed.success) {
        result.error_message = parsed.error_message;
        return result;
    }

    if (category == UnitCategory::Timer) {
        auto timers = base_args(scope);
        timers.insert(timers.end(), {"list-timers", "--all", "--no-pager", "--output=json"});
        merge_details(parsed.units, parse_timer_details(run_optional_query(timers, "list-timers"),
                                                        realtime_now_us()));
    } else if (category == UnitCategory::Socket) {
        auto sockets = base_args(scope);
        sockets.insert(sockets.end(), {"list-sockets", "--all", "--no-pager", "--output=json"});
        merge_details(parsed.units, parse_socket_details(run_optional_query(sockets, "list-sockets")));
    }

    auto files = base_args(scope);
    files.insert(files.end(), {"list-unit-files", type_arg, "--no-pager", "--output=json"});
    merge_file_states(parsed.units, parse_unit_file_states(run_optional_query(files, "list-unit-files")));

    spdlog::debug("systemctl listed {} units of type {}", parsed.units.size(), category_type_arg(category));
    result.units = std::move(parsed.units);
    result.success = true;
    return result;
}

UnitProperties SystemctlUnitSource::get_properties(const std::string& name, Scope scope) {
    auto argv = base_args(scope);
    argv.insert(argv.end(), {"show", name, "--no-pager"});

    auto output = run_process(argv, kQueryTimeout);
    if (!output.ok()) {
        errors_.add(std::format("show {}: {}", name, describe_failure(output, "systemctl")));
        return UnitProperties{};
    }
    return parse_show_output(output.stdout_text);
}

ActionResult SystemctlUnitSource::run_action(UnitAction action, const std::string& name, Scope scope) {
    auto argv = base_args(scope);
    argv.emplace_back(action_verb(action));
    if (!is_host_wide(action)) {
        argv.push_back(name);
    }

    std::string command_line;
    for (const auto& arg : argv) {
        if (!command_line.empty()) command_line += ' ';
        command_line += arg;
    }
    spdlog::info("running {}", command_line);
    auto output = run_process(argv, kActionTimeout);
    if (output.ok()) {
        if (name.empty()) {
            return {true, std::format("{} succeeded", action_label(action))};
        }
        return {true, std::format("{} succeeded for {}", action_label(action), name)};
    }
    return {false, std::format("{} failed: {}", action_label(action), describe_failure(output, "systemctl"))};
}

FileContentResult SystemctlUnitSource::get_file_content(const std::string& name, Scope scope) {
    FileContentResult result;
    auto argv = base_args(scope);
    argv.insert(argv.end(), {"cat", name, "--no-pager"});

    auto output = run_process(argv, kQueryTimeout);
    if (!output.ok()) {
        result.error_message = describe_failure(output, "systemctl");
        return result;
    }

    result.lines = split_lines(output.stdout_text);
    result.success = true;
    return result;
}

} // namespace svcdeck
