#pragma once

#include "core/error.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <format>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>
#include <thread>

namespace dbgate {

/**
 * @brief Runs work on its own thread and waits at most a deadline for it.
 *
 * On a missed deadline the caller gets TIMEOUT_ERROR immediately; the worker
 * keeps running and its late result is dropped when it finishes. Work must
 * therefore own (or share) everything it touches.
 *
 * Workers stay joinable: finished ones are joined when the next one starts,
 * and join() waits for the rest. After join() every run() is refused.
 * The destructor joins.
 */
class DeadlineRunner {
public:
    DeadlineRunner() = default;
    ~DeadlineRunner() { join(); }

    DeadlineRunner(const DeadlineRunner&) = delete;
    DeadlineRunner& operator=(const DeadlineRunner&) = delete;

    template<typename T>
    [[nodiscard]] Result<T> run(std::chrono::milliseconds timeout,
                                std::function<Result<T>()> fn,
                                std::string_view what);

    void join() {
        std::list<Worker> pending;
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            pending.swap(workers_);
        }
        for (auto& w : pending) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    // Workers that have not finished yet
    [[nodiscard]] size_t outstanding() const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& w : workers_) {
            if (!w.done.load()) ++n;
        }
        return n;
    }

private:
    struct Worker {
        std::thread thread;
        std::atomic<bool> done{false};
    };

    // Caller holds mutex_
    void reap_finished() {
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done.load()) {
                if (it->thread.joinable()) it->thread.join();
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    mutable std::mutex mutex_;
    std::list<Worker> workers_;
    bool closed_ = false;
};

template<typename T>
Result<T> DeadlineRunner::run(std::chrono::milliseconds timeout,
                              std::function<Result<T>()> fn,
                              std::string_view what) {
    auto task = std::make_shared<std::packaged_task<Result<T>()>>(std::move(fn));
    auto future = task->get_future();

    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return Result<T>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("{}: shutting down", what));
        }
        reap_finished();

        auto& worker = workers_.emplace_back();
        try {
            worker.thread = std::thread([task, &worker]() {
                (*task)();
                worker.done.store(true);
            });
        } catch (const std::system_error& e) {
            workers_.pop_back();
            return Result<T>::error(ErrorCategory::INTERNAL_ERROR,
                std::format("{}: failed to start worker: {}", what, e.what()));
        }
    }

    if (future.wait_for(timeout) == std::future_status::timeout) {
        return Result<T>::error(ErrorCategory::TIMEOUT_ERROR,
            std::format("{} timed out after {}ms", what, timeout.count()));
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return Result<T>::error(ErrorCategory::INTERNAL_ERROR,
            std::format("{} failed: {}", what, e.what()));
    }
}

} // namespace dbgate
