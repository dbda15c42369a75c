#pragma once

#include "../unit_info.hpp"
#include "../errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace svcdeck {

struct LogFetchResult {
    bool success = false;
    std::vector<LogRecord> records;
    std::string error_message;
};

class ILogSource {
public:
    virtual ~ILogSource() = default;

    // Up to `limit` most recent records, oldest first
    virtual LogFetchResult fetch_recent(const std::string& unit, Scope scope, size_t limit,
                                        std::optional<int> max_priority, TimeRange range) = 0;

    // Records strictly after the given continuity cursor, oldest first
    virtual LogFetchResult fetch_since(const std::string& unit, const std::string& cursor, Scope scope,
                                       std::optional<int> max_priority, TimeRange range) = 0;

    virtual std::vector<SourceError> get_recent_errors() = 0;
};

} // namespace svcdeck
