#include "sync/TransferEngine.hpp"
#include "sync/Copier.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <fmt/core.h>
#include <system_error>

using namespace nsync::sync;
using namespace nsync::sync::model;
using namespace nsync::log;
namespace fs = std::filesystem;

TransferEngine::TransferEngine(fs::path destinationRoot, const bool verify,
                               std::shared_ptr<Copier> copier,
                               std::shared_ptr<std::atomic<bool>> interruptFlag)
    : destinationRoot_(std::move(destinationRoot)),
      verify_(verify),
      copier_(std::move(copier)),
      interruptFlag_(std::move(interruptFlag)) {
    if (!copier_) throw std::invalid_argument("TransferEngine requires a copier");
}

fs::path TransferEngine::destinationFor(const std::string& runName) const {
    return destinationRoot_ / runName;
}

fs::path TransferEngine::stagingFor(const std::string& runName) const {
    return destinationRoot_ / ("." + runName + ".partial");
}

TransferResult TransferEngine::transfer(const Run& run, const ClaimHook& claim) const {
    const auto destination = destinationFor(run.name);
    const auto staging = stagingFor(run.name);

    Registry::transfer()->info("[TransferEngine] Syncing run '{}' to '{}'...", run.name, destinationRoot_.string());

    try {
        if (fs::exists(fs::symlink_status(destination))) {
            if (!run.mayReplaceDestination()) {
                Registry::transfer()->warn("[TransferEngine] Run '{}' already exists in '{}'",
                                           run.name, destinationRoot_.string());
                return {Outcome::transferFailed("destination already exists"), false};
            }
            Registry::transfer()->info("[TransferEngine] Replacing '{}' from an earlier transfer of run '{}' "
                                       "({} previous attempt(s))", destination.string(), run.name, run.previous_attempts);
            fs::remove_all(destination);
        }

        if (fs::exists(fs::symlink_status(staging))) fs::remove_all(staging);

        copier_->copyTree(run.source_path, staging, interruptFlag_);
        if (claim) claim(run.name);
        fs::rename(staging, destination);
    } catch (const CopyInterrupted&) {
        Registry::transfer()->info("[TransferEngine] Copy of run '{}' interrupted by shutdown", run.name);
        return {Outcome::transferFailed("interrupted"), true};
    } catch (const std::exception& e) {
        Registry::transfer()->error("[TransferEngine] Unable to copy run '{}': {}", run.name, e.what());
        return {Outcome::transferFailed(e.what()), false};
    }

    auto outcome = verify_ ? verify(run, destination) : Outcome::synced();
    if (outcome.status == Status::SYNCED)
        Registry::transfer()->info("[TransferEngine] Run '{}' synced successfully.", run.name);

    return {std::move(outcome), false};
}

Outcome TransferEngine::verify(const Run& run, const fs::path& destination) const {
    uintmax_t sourceSize = 0, destinationSize = 0;

    try {
        sourceSize = util::directorySize(run.source_path);
        destinationSize = util::directorySize(destination);
    } catch (const std::exception& e) {
        Registry::transfer()->error("[TransferEngine] Unable to measure run '{}': {}", run.name, e.what());
        return Outcome::transferFailed(fmt::format("size check failed: {}", e.what()));
    }

    if (sourceSize != destinationSize) {
        Registry::transfer()->error("[TransferEngine] Size mismatch for run '{}': source size {}, destination size {}.",
                                    run.name, sourceSize, destinationSize);
        return Outcome::verificationFailed(fmt::format("size mismatch: source {} bytes, destination {} bytes",
                                                       sourceSize, destinationSize));
    }

    Registry::transfer()->debug("[TransferEngine] Verified run '{}': {} ({} bytes)",
                                run.name, util::bytesToSize(sourceSize), sourceSize);
    return Outcome::synced(sourceSize);
}
