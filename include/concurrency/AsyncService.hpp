#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace nsync::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    // Shared with the long-running operations the service starts
    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& interruptFlag() const { return interruptFlag_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    std::thread worker_;

    virtual void runLoop() = 0;

    // Wakes runLoop() when it is sleeping between iterations
    virtual void onStopRequested() {}
};

}
