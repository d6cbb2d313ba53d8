/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Elastic worker pool backing the one-worker-per-connection model.
 *
 * @details
 * This header defines the `Scheduler` class, a Producer-Consumer pool in which the
 * accept loop produces session tasks and worker threads consume them. A chat session
 * occupies its worker for the whole lifetime of the connection, so the pool grows
 * instead of queueing: a task never waits behind a long-lived session.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace parley::infra {

/**
 * @class Scheduler
 * @brief A thread-safe, growing worker pool.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Growth:** When a task is enqueued and there are more pending tasks than idle
 *   workers, a new worker is spawned. Workers finishing a task return to the idle set
 *   and are reused by later connections.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the pool with a warm cohort of worker threads.
     *
     * @param threads The number of workers spawned up front. The pool may grow beyond it.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops accepting tasks, drains the queue and joins every worker.
     *
     * @note **Blocking**: running tasks (live sessions) must finish first. The server
     * shuts its connections down before destroying the pool.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @param task The unit of work, typically one client session.
     * @throws std::runtime_error If the scheduler is already shutting down.
     */
    void enqueue(std::function<void()> task);

    /// @brief Number of worker threads spawned so far.
    size_t size() const;

  private:
    /// @brief Spawns one worker. Caller holds `queue_mutex_`.
    void spawn_worker();

    /// @brief Event loop executed by every worker thread.
    void worker_loop();

    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> tasks_;

    /// @brief Guards `workers_`, `tasks_`, `idle_` and `stop_`.
    mutable std::mutex queue_mutex_;

    std::condition_variable condition_;

    /// @brief Workers currently blocked waiting for a task.
    size_t idle_;

    bool stop_;
};

} // namespace parley::infra
