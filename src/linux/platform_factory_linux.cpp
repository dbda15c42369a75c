#include "../platform_factory.hpp"

#include "journalctl_log_source.hpp"
#include "systemctl_unit_source.hpp"

namespace svcdeck {

std::unique_ptr<IUnitSource> make_unit_source() {
    return std::make_unique<SystemctlUnitSource>();
}

std::unique_ptr<IUnitSource> make_action_unit_source() {
    // Separate instance per action worker to avoid sharing state with the UI thread.
    return std::make_unique<SystemctlUnitSource>();
}

std::unique_ptr<ILogSource> make_log_source() {
    return std::make_unique<JournalctlLogSource>();
}

} // namespace svcdeck
