#include "sync/model/Status.hpp"

namespace nsync::sync::model {

std::string_view toString(const Status s) noexcept {
    switch (s) {
        case Status::DISCOVERED:          return "discovered";
        case Status::PENDING:             return "pending";
        case Status::TRANSFERRING:        return "transferring";
        case Status::SYNCED:              return "synced";
        case Status::VERIFICATION_FAILED: return "verification_failed";
        case Status::TRANSFER_FAILED:     return "transfer_failed";
        case Status::UNKNOWN:
        default:                          return "unknown";
    }
}

bool tryParseStatus(const std::string_view in, Status& out) noexcept {
    if (in == "discovered")          { out = Status::DISCOVERED; return true; }
    if (in == "pending")             { out = Status::PENDING; return true; }
    if (in == "transferring")        { out = Status::TRANSFERRING; return true; }
    if (in == "synced")              { out = Status::SYNCED; return true; }
    if (in == "verification_failed") { out = Status::VERIFICATION_FAILED; return true; }
    if (in == "transfer_failed")     { out = Status::TRANSFER_FAILED; return true; }
    return false;
}

}
