#include "sync/WatchLoop.hpp"
#include "sync/Copier.hpp"
#include "sync/SyncState.hpp"
#include "sync/TransferEngine.hpp"
#include "sync/tasks/Transfer.hpp"
#include "sync/model/Run.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <set>
#include <variant>

using namespace nsync::sync;
using namespace nsync::sync::model;
using namespace nsync::concurrency;
using namespace nsync::log;
using namespace std::chrono;

WatchLoop::WatchLoop(config::WatchConfig cfg, SyncState& state, std::shared_ptr<Copier> copier)
    : AsyncService("WatchLoop"),
      cfg_(std::move(cfg)),
      state_(state),
      matcher_(cfg_.run_name_pattern),
      detector_(cfg_.completion_signal_pattern, interruptFlag_),
      engine_(std::make_shared<TransferEngine>(cfg_.destination, cfg_.verify, std::move(copier), interruptFlag_)),
      pool_(std::make_unique<ThreadPool>(interruptFlag_, std::max(1u, cfg_.transfer_workers))) {}

WatchLoop::~WatchLoop() {
    stop();
    pool_->stop();
}

void WatchLoop::runLoop() {
    Registry::watch()->info("[WatchLoop] Watching '{}' for new runs every {}s", cfg_.source.string(),
                            cfg_.poll_interval.count());

    while (!interruptFlag_->load()) {
        const auto report = pollOnce();
        Registry::watch()->debug("[WatchLoop] Cycle done: {} candidate(s), {} waiting, {} started, {} synced, "
                                 "{} failed, {} verification failed, {} error(s)",
                                 report.candidates, report.waiting, report.started, report.synced,
                                 report.transfer_failed, report.verification_failed, report.errors);
        sleepUntilNextCycle();
    }

    Registry::watch()->info("[WatchLoop] Interrupted, stop watching for new runs");
}

void WatchLoop::onStopRequested() {
    { std::scoped_lock lock(sleepMutex_); }
    sleepCv_.notify_all();
}

void WatchLoop::sleepUntilNextCycle() {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, cfg_.poll_interval, [this] { return interruptFlag_->load(); });
}

CycleReport WatchLoop::pollOnce() {
    CycleReport report;
    std::vector<std::string> names;

    try {
        names = matcher_.candidates(cfg_.source);
    } catch (const std::exception& e) {
        Registry::watch()->warn("[WatchLoop] Unable to list source '{}': {}", cfg_.source.string(), e.what());
        ++report.errors;
        return report;
    }

    report.candidates = names.size();
    InFlight inFlight;

    for (const auto& name : names) {
        if (interruptFlag_->load()) break;
        try {
            processCandidate(name, report, inFlight);
        } catch (const std::exception& e) {
            Registry::watch()->error("[WatchLoop] Failed to process run '{}': {}", name, e.what());
            ++report.errors;
        }
    }

    collect(inFlight, report);

    // Forget settle times of runs that disappeared from the source
    const std::set<std::string> present(names.begin(), names.end());
    std::erase_if(completeSince_, [&](const auto& kv) { return !present.contains(kv.first); });

    return report;
}

void WatchLoop::processCandidate(const std::string& name, CycleReport& report, InFlight& inFlight) {
    state_.observe(name);

    const auto status = state_.getStatus(name);
    if (isTerminal(status) || state_.isInFlight(name)) {
        completeSince_.erase(name);
        return;
    }

    const auto detection = detector_.detect(cfg_.source / name);

    if (detection.failed()) {
        Registry::watch()->warn("[WatchLoop] Completion check failed for run '{}': {}", name, detection.error);
        ++report.errors;
        return;
    }

    if (!detection.complete()) {
        state_.markPending(name);
        Registry::watch()->debug("[WatchLoop] Run '{}' is not complete yet", name);
        ++report.waiting;
        return;
    }

    const auto now = steady_clock::now();
    const auto [since, first] = completeSince_.try_emplace(name, now);
    if (first)
        Registry::watch()->info("[WatchLoop] Run completion detected for '{}' ({})", name, detection.signal.string());

    if (now - since->second < cfg_.completion_delay) {
        Registry::watch()->debug("[WatchLoop] Waiting {} seconds before syncing run '{}'",
                                 cfg_.completion_delay.count(), name);
        ++report.waiting;
        return;
    }

    const auto previous = state_.record(name);
    if (!state_.tryBeginTransfer(name)) return;
    completeSince_.erase(name);

    Run run(name, cfg_.source, cfg_.destination);
    run.previous_attempts = previous ? previous->attempts : 0;
    run.destination_owned = previous && previous->destination_owned;

    const auto task = std::make_shared<tasks::Transfer>(state_, engine_, std::move(run));
    auto future = task->getFuture();

    try {
        pool_->submit(task);
    } catch (const std::exception&) {
        state_.abandonTransfer(name);
        throw;
    }

    inFlight.emplace_back(name, std::move(*future));
    ++report.started;
}

void WatchLoop::collect(InFlight& inFlight, CycleReport& report) {
    for (auto& [name, future] : inFlight) {
        try {
            const auto result = future.get();

            if (const auto* status = std::get_if<Status>(&result)) {
                switch (*status) {
                    case Status::SYNCED:              ++report.synced; break;
                    case Status::VERIFICATION_FAILED: ++report.verification_failed; break;
                    case Status::TRANSFER_FAILED:     ++report.transfer_failed; break;
                    case Status::TRANSFERRING:        ++report.interrupted; break;
                    default: break;
                }
            } else {
                ++report.errors;
            }
        } catch (const std::exception& e) {
            // Task dropped by the pool before it ran
            state_.abandonTransfer(name);
            if (interruptFlag_->load()) {
                Registry::watch()->info("[WatchLoop] Transfer of run '{}' not started, shutting down", name);
                ++report.interrupted;
            } else {
                Registry::watch()->error("[WatchLoop] Transfer of run '{}' did not report back: {}", name, e.what());
                ++report.errors;
            }
        }
    }
    inFlight.clear();
}
