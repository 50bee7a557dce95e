#pragma once

#include <cstdint>
#include <string_view>

namespace nsync::sync::model {

// Persisted as lower-case strings: discovered/pending/transferring/synced/verification_failed/transfer_failed
enum class Status : uint8_t {
    UNKNOWN,
    DISCOVERED,
    PENDING,
    TRANSFERRING,
    SYNCED,
    VERIFICATION_FAILED,
    TRANSFER_FAILED
};

[[nodiscard]] std::string_view toString(Status s) noexcept;

[[nodiscard]] bool tryParseStatus(std::string_view in, Status& out) noexcept;

// Never transferred again without an operator reset
[[nodiscard]] constexpr bool isTerminal(const Status s) noexcept {
    return s == Status::SYNCED || s == Status::VERIFICATION_FAILED;
}

}
