#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace nsync::concurrency {

class ThreadPool {
public:
    // Queued tasks are dropped unrun once `interruptFlag` is raised; their futures report broken_promise.
    // Throws std::system_error when a worker cannot be started.
    explicit ThreadPool(const std::shared_ptr<std::atomic<bool>>& interruptFlag,
                        unsigned int nThreads = 1);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks, lets running ones finish, joins the workers
    void stop();

    void submit(std::shared_ptr<Task> task);

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::shared_ptr<std::atomic<bool>> interruptFlag;
    std::atomic<bool> stopFlag{false};
};

} // namespace nsync::concurrency
