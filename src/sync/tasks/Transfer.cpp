#include "sync/tasks/Transfer.hpp"
#include "sync/SyncState.hpp"
#include "sync/TransferEngine.hpp"
#include "log/Registry.hpp"

using namespace nsync::sync;
using namespace nsync::sync::tasks;
using namespace nsync::sync::model;
using namespace nsync::log;

Transfer::Transfer(SyncState& state, std::shared_ptr<const TransferEngine> engine, Run run)
    : state(state), engine(std::move(engine)), run(std::move(run)) {}

void Transfer::operator()() {
    try {
        const auto result = engine->transfer(run, [this](const std::string& name) { state.claimDestination(name); });

        if (result.interrupted) {
            state.abandonTransfer(run.name);
            promise.set_value(Status::TRANSFERRING);
            return;
        }

        state.recordOutcome(run.name, result.outcome);
        if (result.outcome.status == Status::TRANSFER_FAILED)
            Registry::transfer()->warn("[TransferTask] Run '{}' will be retried: {}", run.name, result.outcome.reason);

        promise.set_value(result.outcome.status);
    } catch (const std::exception& e) {
        // Persisting the outcome failed; drop the in-flight mark so a later cycle can retry
        Registry::transfer()->error("[TransferTask] Failed to complete transfer of run '{}': {}", run.name, e.what());
        state.abandonTransfer(run.name);
        promise.set_value(false);
    }
}
