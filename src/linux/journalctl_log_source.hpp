#pragma once

#include "../interfaces/i_log_source.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace svcdeck {

// ILogSource backed by `journalctl --output=json`
class JournalctlLogSource : public ILogSource {
public:
    JournalctlLogSource() = default;
    ~JournalctlLogSource() override = default;

    LogFetchResult fetch_recent(const std::string& unit, Scope scope, size_t limit,
                                std::optional<int> max_priority, TimeRange range) override;
    LogFetchResult fetch_since(const std::string& unit, const std::string& cursor, Scope scope,
                               std::optional<int> max_priority, TimeRange range) override;
    std::vector<SourceError> get_recent_errors() override;

    // Command line for a fetch; exposed for tests
    static std::vector<std::string> build_args(const std::string& unit, Scope scope,
                                               const std::string& position_arg,
                                               const std::string& position_value,
                                               std::optional<int> max_priority, TimeRange range);

    static constexpr std::chrono::seconds kQueryTimeout{15};

private:
    LogFetchResult run(const std::vector<std::string>& argv, const std::string& unit);

    ErrorRing errors_{"journalctl"};
};

} // namespace svcdeck
