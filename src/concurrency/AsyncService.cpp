#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace nsync::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName), interruptFlag_(std::make_shared<std::atomic<bool>>(false)) {}

AsyncService::~AsyncService() {
    // Subclasses stop() in their own destructor, runLoop() is gone by now
    if (worker_.joinable()) {
        interruptFlag_->store(true, std::memory_order_release);
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_->store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::nanosync()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::nanosync()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::nanosync()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_->store(true, std::memory_order_release);
    onStopRequested();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ set until next start() resets it
    log::Registry::nanosync()->info("[{}] Service stopped.", serviceName_);
}
