#pragma once

#include "../interfaces/i_unit_source.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace svcdeck {

// IUnitSource backed by the systemctl command line tool
class SystemctlUnitSource : public IUnitSource {
public:
    SystemctlUnitSource() = default;
    ~SystemctlUnitSource() override = default;

    UnitListResult list_units(UnitCategory category, Scope scope) override;
    UnitProperties get_properties(const std::string& name, Scope scope) override;
    ActionResult run_action(UnitAction action, const std::string& name, Scope scope) override;
    FileContentResult get_file_content(const std::string& name, Scope scope) override;
    std::vector<SourceError> get_recent_errors() override;

    static constexpr std::chrono::seconds kQueryTimeout{15};
    static constexpr std::chrono::seconds kActionTimeout{90};

private:
    static std::vector<std::string> base_args(Scope scope);

    // Best-effort extras for list_units; failures only land in the error ring
    std::string run_optional_query(std::vector<std::string> argv, const char* what);

    ErrorRing errors_{"systemctl"};
};

} // namespace svcdeck
