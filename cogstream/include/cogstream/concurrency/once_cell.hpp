#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <utility>

namespace cogstream {
namespace detail {

/// One-shot lazily initialised value.
/// Concurrent first callers of get_or_init() run the initialiser exactly once;
/// all of them observe the same stored value (errors included when T is a Result).
template <typename T>
class OnceCell {
private:
    std::atomic<bool> ready_{false};
    std::mutex mutex_;
    std::optional<T> value_;

public:
    OnceCell() = default;
    OnceCell(const OnceCell&) = delete;
    OnceCell& operator=(const OnceCell&) = delete;

    template <typename F>
    const T& get_or_init(F&& init) {
        if (ready_.load(std::memory_order_acquire)) {
            return *value_;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ready_.load(std::memory_order_relaxed)) {
            value_.emplace(std::forward<F>(init)());
            ready_.store(true, std::memory_order_release);
        }
        return *value_;
    }

    /// The value if already initialised
    [[nodiscard]] const T* get() const noexcept {
        return ready_.load(std::memory_order_acquire) ? &*value_ : nullptr;
    }

    /// Drop the value. Not safe against concurrent get_or_init().
    void reset() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        value_.reset();
        ready_.store(false, std::memory_order_release);
    }
};

} // namespace detail
} // namespace cogstream
