#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace svcdeck {

struct DetailsViewModel {
    // Which unit the lines describe
    std::string unit_name;

    // Formatted property lines
    std::vector<std::string> lines;

    // First visible line
    size_t scroll = 0;
};

} // namespace svcdeck
