#pragma once

#include "concurrency/Task.hpp"
#include "sync/model/Run.hpp"

#include <memory>

namespace nsync::sync {
class SyncState;
class TransferEngine;
}

namespace nsync::sync::tasks {

// Runs one admitted transfer and records its outcome. The future carries the
// final status, TRANSFERRING when shutdown interrupted the copy, or false.
struct Transfer final : concurrency::PromisedTask {
    SyncState& state;
    std::shared_ptr<const TransferEngine> engine;
    model::Run run;

    Transfer(SyncState& state, std::shared_ptr<const TransferEngine> engine, model::Run run);

    void operator()() override;
};

}
