#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/types.hpp"
#include "config/Config.hpp"
#include "sync/CompletionDetector.hpp"
#include "sync/RunMatcher.hpp"

#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace nsync::concurrency { class ThreadPool; }

namespace nsync::sync {

class Copier;
class SyncState;
class TransferEngine;

// Counters for one polling cycle
struct CycleReport {
    size_t candidates{0};
    size_t waiting{0};        // incomplete or still settling
    size_t started{0};
    size_t synced{0};
    size_t transfer_failed{0};
    size_t verification_failed{0};
    size_t interrupted{0};
    size_t errors{0};
};

class WatchLoop final : public concurrency::AsyncService {
public:
    WatchLoop(config::WatchConfig cfg, SyncState& state, std::shared_ptr<Copier> copier);
    ~WatchLoop() override;

    // One full scan of the source root; returns once every transfer it started has finished
    CycleReport pollOnce();

protected:
    void runLoop() override;
    void onStopRequested() override;

private:
    using InFlight = std::vector<std::pair<std::string, std::future<ExpectedFuture>>>;

    config::WatchConfig cfg_;
    SyncState& state_;
    RunMatcher matcher_;
    CompletionDetector detector_;
    std::shared_ptr<const TransferEngine> engine_;
    std::unique_ptr<concurrency::ThreadPool> pool_;

    // First time each run was seen complete, for the settle delay
    std::map<std::string, std::chrono::steady_clock::time_point> completeSince_;

    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;

    void processCandidate(const std::string& name, CycleReport& report, InFlight& inFlight);

    void collect(InFlight& inFlight, CycleReport& report);

    void sleepUntilNextCycle();
};

}
