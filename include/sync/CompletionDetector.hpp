#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <regex>
#include <string>

namespace nsync::sync {

struct Detection {
    enum class State : uint8_t { INCOMPLETE, COMPLETE, ERROR };

    State state{State::INCOMPLETE};
    std::filesystem::path signal;  // the matching file when COMPLETE
    std::string error;             // set when ERROR

    [[nodiscard]] bool complete() const noexcept { return state == State::COMPLETE; }
    [[nodiscard]] bool failed() const noexcept { return state == State::ERROR; }
};

class CompletionDetector {
public:
    CompletionDetector(const std::string& signalPattern,
                       std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr);

    // Looks for a regular file below `runDir` whose path matches the signal pattern.
    // Walk errors are reported as ERROR and never thrown.
    [[nodiscard]] Detection detect(const std::filesystem::path& runDir) const;

private:
    std::regex pattern_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;

    [[nodiscard]] bool interrupted() const { return interruptFlag_ && interruptFlag_->load(); }
};

}
