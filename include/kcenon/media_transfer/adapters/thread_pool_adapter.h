// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Sequential task lanes for the download scheduler
 *
 * A lane executes submitted tasks one after another, in submission order,
 * on a single worker. The download scheduler owns a fixed number of lanes,
 * which bounds the number of concurrently running part loops.
 *
 * Features:
 * - thread_system integration (single-worker thread_pool per lane)
 * - Fallback to a dedicated std::thread when thread_system is unavailable
 * - Pending task tracking and idle waiting for orderly shutdown and tests
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::media_transfer::adapters {

/**
 * @brief Interface for a sequential task lane
 */
class task_lane_interface {
public:
    virtual ~task_lane_interface() = default;

    /**
     * @brief Append a task to the lane
     * @param task The task to execute after all previously submitted ones
     * @return Future for the task completion. If the lane is shut down
     *         before the task starts, the task is skipped and the future
     *         is satisfied without running it.
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Number of tasks queued or running
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Check if the lane accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Block until no task is queued or running
     * @param timeout Maximum time to wait
     * @return true if the lane became idle
     */
    virtual bool wait_idle(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Stop accepting tasks, skip queued ones, join the worker
     *
     * A task that is already running completes first.
     */
    virtual void shutdown() = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Lane backed by a thread_system thread_pool with one worker
 */
class thread_system_task_lane : public task_lane_interface {
public:
    explicit thread_system_task_lane(const std::string& lane_name);
    ~thread_system_task_lane() override;

    thread_system_task_lane(const thread_system_task_lane&) = delete;
    thread_system_task_lane& operator=(const thread_system_task_lane&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] bool is_running() const override;
    bool wait_idle(std::chrono::milliseconds timeout) override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Lane backed by one dedicated std::thread and a FIFO queue
 *
 * Used when thread_system is not available.
 */
class worker_task_lane : public task_lane_interface {
public:
    explicit worker_task_lane(const std::string& lane_name);
    ~worker_task_lane() override;

    worker_task_lane(const worker_task_lane&) = delete;
    worker_task_lane& operator=(const worker_task_lane&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] bool is_running() const override;
    bool wait_idle(std::chrono::milliseconds timeout) override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available lane implementation
 *
 * 1. thread_system_task_lane (when KCENON_WITH_THREAD_SYSTEM)
 * 2. worker_task_lane (fallback)
 */
class task_lane_factory {
public:
    [[nodiscard]] static std::unique_ptr<task_lane_interface> create(
        const std::string& lane_name);

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::media_transfer::adapters
