#include "sync/SyncState.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

#include <fmt/core.h>
#include <ranges>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

using namespace nsync::sync;
using namespace nsync::sync::model;
namespace fs = std::filesystem;

namespace YAML {

template<>
struct convert<SyncRecord> {
    static Node encode(const SyncRecord& rhs) {
        Node node;
        node["run_name"] = rhs.run_name;
        node["status"] = std::string(toString(rhs.status));
        node["first_seen_at"] = nsync::util::timestampToString(rhs.first_seen_at);
        node["updated_at"] = nsync::util::timestampToString(rhs.updated_at);
        node["attempts"] = rhs.attempts;
        node["bytes"] = rhs.bytes;
        node["reason"] = rhs.reason;
        node["destination_owned"] = rhs.destination_owned;
        return node;
    }

    static bool decode(const Node& node, SyncRecord& rhs) {
        if (!node.IsMap() || !node["run_name"] || !node["status"]) return false;
        rhs.run_name = node["run_name"].as<std::string>();
        if (!tryParseStatus(node["status"].as<std::string>(), rhs.status)) return false;
        if (rhs.status == Status::UNKNOWN) return false;
        rhs.first_seen_at = nsync::util::parseTimestampFromString(node["first_seen_at"].as<std::string>());
        rhs.updated_at = nsync::util::parseTimestampFromString(node["updated_at"].as<std::string>());
        rhs.attempts = node["attempts"].as<unsigned int>(0);
        rhs.bytes = node["bytes"].as<uintmax_t>(0);
        rhs.reason = node["reason"].as<std::string>("");
        rhs.destination_owned = node["destination_owned"] && node["destination_owned"].as<bool>();
        return true;
    }
};

}

SyncState::SyncState(fs::path stateFile) : stateFile_(std::move(stateFile)) {
    load();
}

void SyncState::load() {
    std::error_code ec;
    if (!fs::exists(stateFile_, ec)) {
        if (ec) throw config::ConfigError(fmt::format("Cannot access state file '{}': {}", stateFile_.string(), ec.message()));
        log::Registry::state()->info("[SyncState] No state file at '{}', starting fresh", stateFile_.string());
        return;
    }

    try {
        const auto root = YAML::LoadFile(stateFile_.string());
        if (const auto version = root["version"].as<int>(FILE_VERSION); version != FILE_VERSION)
            throw config::ConfigError(fmt::format("Unsupported state file version {}", version));

        if (const auto runs = root["runs"]) {
            if (!runs.IsSequence()) throw config::ConfigError("'runs' is not a list");
            for (const auto& node : runs) {
                auto rec = node.as<SyncRecord>();
                if (rec.status == Status::TRANSFERRING)
                    log::Registry::state()->warn("[SyncState] Run '{}' was left transferring by a previous process, "
                                                 "it will be transferred again", rec.run_name);
                records_[rec.run_name] = std::move(rec);
            }
        }
    } catch (const std::exception& e) {
        throw config::ConfigError(fmt::format("Corrupt state file '{}': {}", stateFile_.string(), e.what()));
    }

    log::Registry::state()->info("[SyncState] Loaded {} run record(s) from '{}'", records_.size(), stateFile_.string());
}

void SyncState::persist(const std::map<std::string, SyncRecord>& records) const {
    YAML::Node root;
    root["version"] = FILE_VERSION;
    YAML::Node runs(YAML::NodeType::Sequence);
    for (const auto& rec : records | std::views::values) runs.push_back(rec);
    root["runs"] = runs;

    YAML::Emitter out;
    out << root;
    if (!out.good()) throw std::runtime_error("Failed to encode sync state: " + out.GetLastError());

    if (stateFile_.has_parent_path()) fs::create_directories(stateFile_.parent_path());
    util::writeFileDurably(stateFile_, std::string(out.c_str()) + "\n");
}

void SyncState::commit(const SyncRecord& next, const Status from) {
    auto copy = records_;
    copy[next.run_name] = next;
    persist(copy);
    records_ = std::move(copy);

    log::Registry::state()->debug("[SyncState] {}: {} -> {}", next.run_name, toString(from), toString(next.status));
    log::Registry::audit()->info("run={} from={} to={} attempts={}{}", next.run_name, toString(from),
                                 toString(next.status), next.attempts,
                                 next.reason.empty() ? "" : " reason=\"" + next.reason + "\"");
}

Status SyncState::getStatus(const std::string& runName) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(runName);
    return it == records_.end() ? Status::UNKNOWN : it->second.status;
}

std::optional<SyncRecord> SyncState::record(const std::string& runName) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(runName);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<SyncRecord> SyncState::records() const {
    std::scoped_lock lock(mutex_);
    std::vector<SyncRecord> out;
    out.reserve(records_.size());
    for (const auto& rec : records_ | std::views::values) out.push_back(rec);
    return out;
}

bool SyncState::isInFlight(const std::string& runName) const {
    std::scoped_lock lock(mutex_);
    return inFlight_.contains(runName);
}

void SyncState::observe(const std::string& runName) {
    std::scoped_lock lock(mutex_);
    if (records_.contains(runName)) return;

    commit(SyncRecord(runName, util::now()), Status::UNKNOWN);
    log::Registry::state()->info("[SyncState] Detected new run: '{}'", runName);
}

void SyncState::markPending(const std::string& runName) {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(runName);
    if (it == records_.end() || it->second.status != Status::DISCOVERED) return;

    auto next = it->second;
    next.status = Status::PENDING;
    next.updated_at = util::now();
    commit(next, Status::DISCOVERED);
}

bool SyncState::tryBeginTransfer(const std::string& runName) {
    std::scoped_lock lock(mutex_);
    if (inFlight_.contains(runName)) return false;

    SyncRecord next;
    Status from = Status::UNKNOWN;

    if (const auto it = records_.find(runName); it != records_.end()) {
        from = it->second.status;
        if (isTerminal(from)) return false;
        next = it->second;
    } else {
        next = SyncRecord(runName, util::now());
    }

    next.status = Status::TRANSFERRING;
    next.updated_at = util::now();
    next.reason.clear();
    ++next.attempts;

    commit(next, from);
    inFlight_.insert(runName);
    return true;
}

void SyncState::recordOutcome(const std::string& runName, const Outcome& outcome) {
    if (outcome.status != Status::SYNCED && outcome.status != Status::VERIFICATION_FAILED &&
        outcome.status != Status::TRANSFER_FAILED)
        throw std::invalid_argument(fmt::format("Invalid transfer outcome '{}' for run '{}'",
                                                toString(outcome.status), runName));

    std::scoped_lock lock(mutex_);
    const auto it = records_.find(runName);
    if (!inFlight_.contains(runName) || it == records_.end())
        throw std::logic_error(fmt::format("Run '{}' has no transfer in flight", runName));

    auto next = it->second;
    next.status = outcome.status;
    next.updated_at = util::now();
    next.reason = outcome.reason;
    if (outcome.status == Status::SYNCED) next.bytes = outcome.bytes;

    commit(next, Status::TRANSFERRING);
    inFlight_.erase(runName);
}

void SyncState::claimDestination(const std::string& runName) {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(runName);
    if (!inFlight_.contains(runName) || it == records_.end())
        throw std::logic_error(fmt::format("Run '{}' has no transfer in flight", runName));
    if (it->second.destination_owned) return;

    auto copy = records_;
    copy[runName].destination_owned = true;
    persist(copy);
    records_ = std::move(copy);
    log::Registry::state()->debug("[SyncState] {}: destination claimed", runName);
}

void SyncState::abandonTransfer(const std::string& runName) {
    std::scoped_lock lock(mutex_);
    if (inFlight_.erase(runName))
        log::Registry::state()->info("[SyncState] Transfer of '{}' abandoned, left as transferring", runName);
}

bool SyncState::reset(const std::string& runName, const bool force) {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(runName);
    if (it == records_.end() || inFlight_.contains(runName)) return false;

    const auto from = it->second.status;
    if (from == Status::PENDING || from == Status::DISCOVERED) return false;
    if (from == Status::SYNCED && !force) return false;

    auto next = it->second;
    next.status = Status::PENDING;
    next.updated_at = util::now();
    next.reason = "reset by operator";
    commit(next, from);
    return true;
}
