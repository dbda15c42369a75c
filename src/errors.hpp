#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace svcdeck {

// A failed query that did not fail the operation it was part of
struct SourceError {
    std::chrono::steady_clock::time_point timestamp;
    std::string command;  // "systemctl", "journalctl"
    std::string message;
};

// Bounded, thread-safe list of recent SourceErrors
class ErrorRing {
public:
    static constexpr size_t kMaxErrors = 10;
    static constexpr std::chrono::seconds kMaxAge{10};

    explicit ErrorRing(std::string command) : command_(std::move(command)) {}

    // Records the error and mirrors it to the log at warn
    void add(const std::string& message);

    // Errors younger than kMaxAge, oldest first
    [[nodiscard]] std::vector<SourceError> recent() const;

private:
    std::string command_;
    mutable std::mutex mutex_;
    std::vector<SourceError> errors_;
};

} // namespace svcdeck
