#pragma once

#include "../unit_info.hpp"
#include <string>
#include <vector>

namespace svcdeck {

// One line of `journalctl --output=json`. A line that is not a JSON object
// becomes a record whose message is the raw line.
LogRecord parse_journal_line(const std::string& line);

// Every non-empty line of the output, oldest first
std::vector<LogRecord> parse_journal_output(const std::string& text);

} // namespace svcdeck
