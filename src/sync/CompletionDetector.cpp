#include "sync/CompletionDetector.hpp"

#include <fmt/core.h>
#include <system_error>

using namespace nsync::sync;
namespace fs = std::filesystem;

CompletionDetector::CompletionDetector(const std::string& signalPattern,
                                       std::shared_ptr<std::atomic<bool>> interruptFlag)
    : pattern_(signalPattern, std::regex::ECMAScript | std::regex::optimize),
      interruptFlag_(std::move(interruptFlag)) {}

Detection CompletionDetector::detect(const fs::path& runDir) const {
    Detection result;

    auto fail = [&](const std::string& msg) {
        result.state = Detection::State::ERROR;
        result.error = msg;
        return result;
    };

    std::error_code ec;
    fs::recursive_directory_iterator it(runDir, fs::directory_options::none, ec);
    if (ec) return fail(fmt::format("cannot open '{}': {}", runDir.string(), ec.message()));

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) return fail(fmt::format("walk of '{}' failed: {}", runDir.string(), ec.message()));
        if (interrupted()) return fail("interrupted");

        const auto& entry = *it;
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc) || typeEc) continue;

        const auto path = entry.path().generic_string();
        if (std::regex_search(path, pattern_)) {
            result.state = Detection::State::COMPLETE;
            result.signal = entry.path();
            return result;
        }
    }

    if (ec) return fail(fmt::format("walk of '{}' failed: {}", runDir.string(), ec.message()));
    return result;
}
