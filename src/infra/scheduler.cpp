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
 * @file scheduler.cpp
 * @brief Implementation of the elastic worker pool.
 */

#include "parley/infra/scheduler.hpp"

#include <stdexcept>

namespace parley::infra {

Scheduler::Scheduler(size_t threads) : idle_(0), stop_(false)
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (size_t i = 0; i < threads; ++i) {
        spawn_worker();
    }
}

/**
 * @brief Destructor. Orchestrates a graceful pool teardown.
 *
 * @details
 * `workers_` cannot grow once `stop_` is set, so it is safe to iterate it for joining
 * without holding the lock.
 */
Scheduler::~Scheduler()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void Scheduler::spawn_worker()
{
    workers_.emplace_back([this] { worker_loop(); });
}

/**
 * @brief Worker Thread Event Loop.
 *
 * A worker counts itself idle while waiting so that `enqueue` can tell whether an
 * existing thread will pick the new task up.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        // --- Critical Section: Task Acquisition ---
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            ++idle_;
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            --idle_;

            // Drain before exiting so no accepted connection is left unserved.
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // Execution happens outside the lock; a session may run for hours.
        if (task) {
            task();
        }
    }
}

/**
 * @brief Dispatches a new task, growing the pool when no worker is free.
 *
 * @param task The callable unit of work.
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw std::runtime_error("Scheduler: enqueue after shutdown");
        }

        tasks_.emplace(std::move(task));

        if (tasks_.size() > idle_) {
            spawn_worker();
        }
    }

    condition_.notify_one();
}

size_t Scheduler::size() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return workers_.size();
}

} // namespace parley::infra
