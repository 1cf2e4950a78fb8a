// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Sequential task lane implementations
 */

#include "kcenon/media_transfer/adapters/thread_pool_adapter.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::media_transfer::adapters {

// ============================================================================
// Activity tracking helper (shared implementation)
// ============================================================================

namespace {

class lane_activity {
public:
    /// @return false if the lane is stopping and the task must not be queued
    bool begin() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        ++pending_;
        return true;
    }

    void end(size_t count = 1) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_ = count > pending_ ? 0 : pending_ - count;
        }
        idle_cv_.notify_all();
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }

    [[nodiscard]] bool stopping() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopping_;
    }

    [[nodiscard]] size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_;
    }

    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t pending_{0};
    bool stopping_{false};
};

auto ready_future() -> std::future<void> {
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

void run_task(const std::function<void()>& task, std::promise<void>& promise) {
    try {
        task();
        promise.set_value();
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
}

}  // namespace

// ============================================================================
// thread_system_task_lane implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Simple job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "lane_task")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_task_lane::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string lane_name;
    lane_activity activity;
};

thread_system_task_lane::thread_system_task_lane(const std::string& lane_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->lane_name = lane_name;
    pimpl_->pool = std::make_shared<kcenon::thread::thread_pool>(lane_name);

    // One worker keeps the lane strictly sequential
    auto worker = std::make_unique<kcenon::thread::thread_worker>();
    worker->set_job_queue(pimpl_->pool->get_job_queue());
    pimpl_->pool->enqueue(std::move(worker));
    pimpl_->pool->start();
}

thread_system_task_lane::~thread_system_task_lane() {
    shutdown();
}

std::future<void> thread_system_task_lane::submit(std::function<void()> task) {
    if (!pimpl_->activity.begin()) {
        return ready_future();
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* activity = &pimpl_->activity;
    auto wrapped_task = [task = std::move(task), promise, activity]() {
        if (activity->stopping()) {
            promise->set_value();
        } else {
            run_task(task, *promise);
        }
        activity->end();
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped_task)));
    return future;
}

size_t thread_system_task_lane::pending_tasks() const {
    return pimpl_->activity.pending();
}

bool thread_system_task_lane::is_running() const {
    return pimpl_->pool != nullptr && !pimpl_->activity.stopping();
}

bool thread_system_task_lane::wait_idle(std::chrono::milliseconds timeout) {
    return pimpl_->activity.wait_idle(timeout);
}

void thread_system_task_lane::shutdown() {
    if (!pimpl_ || !pimpl_->pool) {
        return;
    }
    pimpl_->activity.stop();
    // Queued jobs observe the stop flag and return immediately
    while (!pimpl_->activity.wait_idle(std::chrono::milliseconds(100))) {
    }
    pimpl_->pool.reset();
}

std::string thread_system_task_lane::name() const {
    return pimpl_->lane_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// worker_task_lane implementation
// ============================================================================

struct worker_task_lane::impl {
    struct queued_task {
        std::function<void()> task;
        std::shared_ptr<std::promise<void>> promise;
    };

    std::string lane_name;
    lane_activity activity;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<queued_task> queue;
    bool stop_requested{false};
    std::thread worker;

    void run() {
        for (;;) {
            queued_task next;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                queue_cv.wait(lock, [this] { return stop_requested || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                next = std::move(queue.front());
                queue.pop_front();
            }

            run_task(next.task, *next.promise);
            activity.end();
        }
    }
};

worker_task_lane::worker_task_lane(const std::string& lane_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->lane_name = lane_name;
    auto* state = pimpl_.get();
    pimpl_->worker = std::thread([state] { state->run(); });
}

worker_task_lane::~worker_task_lane() {
    shutdown();
}

std::future<void> worker_task_lane::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    {
        // shutdown() drains the queue under this lock, so a task counted
        // here is either drained or run by the worker
        std::lock_guard<std::mutex> lock(pimpl_->queue_mutex);
        if (pimpl_->stop_requested || !pimpl_->activity.begin()) {
            return ready_future();
        }
        pimpl_->queue.push_back({std::move(task), std::move(promise)});
    }
    pimpl_->queue_cv.notify_one();
    return future;
}

size_t worker_task_lane::pending_tasks() const {
    return pimpl_->activity.pending();
}

bool worker_task_lane::is_running() const {
    return pimpl_->worker.joinable() && !pimpl_->activity.stopping();
}

bool worker_task_lane::wait_idle(std::chrono::milliseconds timeout) {
    return pimpl_->activity.wait_idle(timeout);
}

void worker_task_lane::shutdown() {
    if (!pimpl_ || !pimpl_->worker.joinable()) {
        return;
    }
    pimpl_->activity.stop();

    std::deque<impl::queued_task> skipped;
    {
        std::lock_guard<std::mutex> lock(pimpl_->queue_mutex);
        skipped.swap(pimpl_->queue);
        pimpl_->stop_requested = true;
    }
    pimpl_->queue_cv.notify_all();

    for (auto& item : skipped) {
        item.promise->set_value();
    }
    pimpl_->activity.end(skipped.size());

    pimpl_->worker.join();
}

std::string worker_task_lane::name() const {
    return pimpl_->lane_name;
}

// ============================================================================
// task_lane_factory implementation
// ============================================================================

std::unique_ptr<task_lane_interface> task_lane_factory::create(
    const std::string& lane_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return std::make_unique<thread_system_task_lane>(lane_name);
#else
    return std::make_unique<worker_task_lane>(lane_name);
#endif
}

}  // namespace kcenon::media_transfer::adapters
