#pragma once

#include "../unit_info.hpp"
#include "../errors.hpp"
#include <string>
#include <vector>

namespace svcdeck {

struct UnitListResult {
    bool success = false;
    std::vector<Unit> units;
    std::string error_message;
};

struct ActionResult {
    bool success = false;
    std::string message;  // Success text or the failure reason
};

struct FileContentResult {
    bool success = false;
    std::vector<std::string> lines;
    std::string error_message;
};

class IUnitSource {
public:
    virtual ~IUnitSource() = default;

    virtual UnitListResult list_units(UnitCategory category, Scope scope) = 0;

    // Never fails: returns a zero-valued record when the unit cannot be queried
    virtual UnitProperties get_properties(const std::string& name, Scope scope) = 0;

    // name is empty for host-wide actions
    virtual ActionResult run_action(UnitAction action, const std::string& name, Scope scope) = 0;

    virtual FileContentResult get_file_content(const std::string& name, Scope scope) = 0;

    virtual std::vector<SourceError> get_recent_errors() = 0;
};

} // namespace svcdeck
