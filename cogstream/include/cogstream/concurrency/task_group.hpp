#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>
#include "../types/result.hpp"

namespace cogstream {

/// Runs a batch of fallible tasks on up to `max_concurrency` threads and joins them.
///
/// Workers pull tasks from a shared index. The first failing task stores its
/// error and requests stop on the group's stop source: tasks not yet started are
/// skipped, running ones see the request through their stop_token. A caller's
/// stop_token is linked to the group's stop source for the duration of run().
///
/// A TaskGroup is used for one batch; run() is not reentrant.
class TaskGroup {
public:
    using Task = std::function<Result<void>(std::stop_token)>;

private:
    std::size_t max_concurrency_;
    std::vector<Task> tasks_;

public:
    /// @param max_concurrency Worker threads; 0 means std::thread::hardware_concurrency()
    explicit TaskGroup(std::size_t max_concurrency = 0) noexcept
        : max_concurrency_(max_concurrency == 0 ? std::thread::hardware_concurrency() : max_concurrency) {
        if (max_concurrency_ == 0) {
            max_concurrency_ = 1;  // hardware_concurrency() may report 0
        }
    }

    void add(Task task) {
        tasks_.push_back(std::move(task));
    }

    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] std::size_t max_concurrency() const noexcept { return max_concurrency_; }

    /// Run every task and wait for all workers.
    /// Returns Cancelled when `caller` requested stop, otherwise the first task error, otherwise Ok.
    [[nodiscard]] Result<void> run(std::stop_token caller = {}) {
        if (tasks_.empty()) {
            return caller.stop_requested() ? Result<void>(Err(Error::Code::Cancelled, "Read cancelled")) : Ok();
        }

        std::stop_source stop;
        std::stop_callback link(caller, [&stop]() { stop.request_stop(); });

        std::atomic<std::size_t> next{0};
        std::mutex error_mutex;
        std::optional<Error> first_error;

        auto worker = [&]() {
            while (!stop.stop_requested()) {
                const std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
                if (index >= tasks_.size()) {
                    return;
                }
                auto result = tasks_[index](stop.get_token());
                if (!result) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) {
                        first_error = result.error();
                    }
                    stop.request_stop();
                    return;
                }
            }
        };

        const std::size_t workers = std::min(max_concurrency_, tasks_.size());
        if (workers == 1) {
            worker();
        } else {
            std::vector<std::future<void>> futures;
            futures.reserve(workers);
            for (std::size_t i = 0; i < workers; ++i) {
                futures.push_back(std::async(std::launch::async, worker));
            }
            for (auto& future : futures) {
                future.get();
            }
        }

        if (caller.stop_requested()) {
            return Err(Error::Code::Cancelled, "Read cancelled");
        }
        if (first_error) {
            return *first_error;
        }
        return Ok();
    }
};

} // namespace cogstream
