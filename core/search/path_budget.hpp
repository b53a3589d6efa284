#pragma once

#include <cstddef>
#include <mutex>

namespace precursor {

/// Tracks accepted paths against a global cap for discovery runs.
/// Check-and-record is synchronized so concurrent start-state searches
/// can share one budget.
class PathBudget {
public:
    explicit PathBudget(size_t max_paths) : max_paths_(max_paths) {}

    bool canContinue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepted_ < max_paths_;
    }

    /// Add accepted paths. Returns true while the cap is not yet reached.
    bool recordPaths(size_t count) {
        std::lock_guard<std::mutex> lock(mutex_);
        accepted_ += count;
        return accepted_ < max_paths_;
    }

    size_t accepted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepted_;
    }

    size_t maxPaths() const { return max_paths_; }
    bool isExhausted() const { return !canContinue(); }

private:
    mutable std::mutex mutex_;
    size_t max_paths_;
    size_t accepted_ = 0;
};

} // namespace precursor
