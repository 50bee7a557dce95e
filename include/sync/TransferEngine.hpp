#pragma once

#include "sync/model/Run.hpp"
#include "sync/model/SyncRecord.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>

namespace nsync::sync {

class Copier;

struct TransferResult {
    model::Outcome outcome;
    bool interrupted{false};  // shutdown stopped the copy; no outcome to record
};

class TransferEngine {
public:
    // Called with the run name right before the staging directory is renamed into place
    using ClaimHook = std::function<void(const std::string&)>;

    TransferEngine(std::filesystem::path destinationRoot, bool verify,
                   std::shared_ptr<Copier> copier,
                   std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // Copies `run` into <destination>/<name> via a staging directory, then verifies the sizes.
    // A destination that exists and is not run.destination_owned is left alone.
    // Never throws for I/O problems or a failing `claim`, those end up in the outcome.
    [[nodiscard]] TransferResult transfer(const model::Run& run, const ClaimHook& claim = {}) const;

    [[nodiscard]] std::filesystem::path destinationFor(const std::string& runName) const;
    [[nodiscard]] std::filesystem::path stagingFor(const std::string& runName) const;

    [[nodiscard]] bool verifies() const { return verify_; }

private:
    std::filesystem::path destinationRoot_;
    bool verify_;
    std::shared_ptr<Copier> copier_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;

    [[nodiscard]] model::Outcome verify(const model::Run& run, const std::filesystem::path& destination) const;
};

}
