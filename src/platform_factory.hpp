#pragma once

#include "interfaces/i_log_source.hpp"
#include "interfaces/i_unit_source.hpp"
#include <memory>

namespace svcdeck {

// Factory functions to create platform-specific sources.
// Implemented per-platform; current build provides Linux implementations.
std::unique_ptr<IUnitSource> make_unit_source();
std::unique_ptr<IUnitSource> make_action_unit_source(); // one per action worker
std::unique_ptr<ILogSource> make_log_source();

} // namespace svcdeck
