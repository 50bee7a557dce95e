#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <system_error>

using namespace nsync::concurrency;

ThreadPool::ThreadPool(const std::shared_ptr<std::atomic<bool> >& interruptFlag,
                       const unsigned int nThreads)
    : interruptFlag(interruptFlag), stopFlag(false) {
    try {
        for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
    } catch (const std::system_error& e) {
        nsync::log::Registry::nanosync()->error("[ThreadPool] Unable to start {} worker(s): {}", nThreads, e.what());
        stop();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task> > empty;
        std::swap(queue, empty);
    }

    stopFlag.store(true);
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");

    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;
            if (interruptFlag && interruptFlag->load()) continue;

            try {
                (*task)();
            } catch (const std::exception& e) {
                nsync::log::Registry::nanosync()->error("[ThreadPool] Task failed: {}", e.what());
            }
        }
    });
}
