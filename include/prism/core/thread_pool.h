// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace prism::core {

// Fixed-size worker pool. Tasks run in FIFO order on whichever worker is free.
class ThreadPool {
public:
    // thread_count == 0 selects std::thread::hardware_concurrency()
    explicit ThreadPool(size_t thread_count = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Queue a task; the future reports completion and rethrows its exception
    std::future<void> Submit(std::function<void()> task);

    size_t ThreadCount() const { return workers_.size(); }

private:
    // Stops the workers and joins every started thread
    void Shutdown();

    std::vector<std::thread> workers_;
    std::queue<std::packaged_task<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace prism::core
