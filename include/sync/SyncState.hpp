#pragma once

#include "sync/model/SyncRecord.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace nsync::sync {

/**
 * Durable record of every run name seen and the single admission gate for transfers.
 *
 * Every transition is written to the state file before the call returns. If the write
 * fails the call throws and the in-memory view is left as it was. Records found in
 * TRANSFERRING when the file is loaded belong to an abandoned attempt and may be
 * admitted again; only runs begun by this instance count as in flight.
 */
class SyncState {
public:
    static constexpr int FILE_VERSION = 1;

    // Loads `stateFile` when present; a corrupt file throws config::ConfigError
    explicit SyncState(std::filesystem::path stateFile);

    SyncState(const SyncState&) = delete;
    SyncState& operator=(const SyncState&) = delete;

    [[nodiscard]] model::Status getStatus(const std::string& runName) const;

    [[nodiscard]] std::optional<model::SyncRecord> record(const std::string& runName) const;

    [[nodiscard]] std::vector<model::SyncRecord> records() const;

    [[nodiscard]] bool isInFlight(const std::string& runName) const;

    // Creates a DISCOVERED record the first time a name is seen
    void observe(const std::string& runName);

    // DISCOVERED -> PENDING; no-op in any other state
    void markPending(const std::string& runName);

    // Atomic check-and-set to TRANSFERRING. False when the run is in flight here,
    // SYNCED or VERIFICATION_FAILED.
    [[nodiscard]] bool tryBeginTransfer(const std::string& runName);

    // TRANSFERRING -> SYNCED / VERIFICATION_FAILED / TRANSFER_FAILED
    void recordOutcome(const std::string& runName, const model::Outcome& outcome);

    // Persists that the destination is about to be created by this transfer, so later
    // attempts may replace it. Throws std::logic_error if the run is not in flight.
    void claimDestination(const std::string& runName);

    // Gives up the in-flight mark without a transition; the record stays TRANSFERRING
    void abandonTransfer(const std::string& runName);

    // Operator re-trigger: back to PENDING. SYNCED runs need `force`.
    [[nodiscard]] bool reset(const std::string& runName, bool force = false);

    [[nodiscard]] const std::filesystem::path& path() const { return stateFile_; }

private:
    std::filesystem::path stateFile_;
    std::map<std::string, model::SyncRecord> records_;
    std::set<std::string> inFlight_;
    mutable std::mutex mutex_;

    void load();

    // Writes `records` to disk; callers swap it in only after this returns
    void persist(const std::map<std::string, model::SyncRecord>& records) const;

    // Applies `next` as the new record for its run: persist first, then publish
    void commit(const model::SyncRecord& next, model::Status from);
};

}
