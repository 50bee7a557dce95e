#pragma once

#include "sync/model/Status.hpp"

#include <cstdint>
#include <ctime>
#include <string>

namespace nsync::sync::model {

struct SyncRecord {
    std::string run_name;
    Status status{Status::DISCOVERED};
    std::time_t first_seen_at{0};
    std::time_t updated_at{0};
    unsigned int attempts{0};
    uintmax_t bytes{0};       // source size of the last verified transfer
    std::string reason;       // failure reason, empty when none
    bool destination_owned{false}; // <destination>/<run> was renamed into place by one of our transfers

    SyncRecord() = default;
    SyncRecord(std::string name, std::time_t now)
        : run_name(std::move(name)), first_seen_at(now), updated_at(now) {}
};

// Result of one transfer attempt, handed to SyncState::recordOutcome
struct Outcome {
    Status status{Status::TRANSFER_FAILED};
    std::string reason;
    uintmax_t bytes{0};

    static Outcome synced(const uintmax_t bytes = 0) { return {Status::SYNCED, {}, bytes}; }
    static Outcome verificationFailed(std::string reason) { return {Status::VERIFICATION_FAILED, std::move(reason), 0}; }
    static Outcome transferFailed(std::string reason) { return {Status::TRANSFER_FAILED, std::move(reason), 0}; }
};

}
