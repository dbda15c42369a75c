#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace svcdeck {

struct UnitFileViewModel {
    std::string unit_name;

    // File text, or a single error line
    std::vector<std::string> lines;
    bool is_error = false;

    size_t scroll = 0;
};

} // namespace svcdeck
