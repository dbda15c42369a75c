#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace svcdeck {

void ErrorRing::add(const std::string& message) {
    spdlog::warn("{}: {}", command_, message);
    std::lock_guard lock(mutex_);
    errors_.push_back({std::chrono::steady_clock::now(), command_, message});
    if (errors_.size() > kMaxErrors) {
        errors_.erase(errors_.begin());
    }
}

std::vector<SourceError> ErrorRing::recent() const {
    std::lock_guard lock(mutex_);
    auto cutoff = std::chrono::steady_clock::now() - kMaxAge;
    std::vector<SourceError> result;
    for (const auto& err : errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

} // namespace svcdeck
