// Config
#include "config/CommandLine.hpp"
#include "config/Config.hpp"

// Sync
#include "sync/Copier.hpp"
#include "sync/SyncState.hpp"
#include "sync/WatchLoop.hpp"

// Misc
#include "log/Registry.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>
#include <fmt/core.h>

using namespace nsync::config;
using namespace nsync::sync;
using namespace nsync::sync::model;
using nsync::log::Registry;

namespace {
constexpr int EXIT_USAGE = 2;

std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

void printRecords(const SyncState& state) {
    const auto records = state.records();
    if (records.empty()) {
        fmt::print("No runs recorded in {}\n", state.path().string());
        return;
    }

    fmt::print("{:<48} {:<20} {:>8} {:>10} {:<20} {}\n", "RUN", "STATUS", "ATTEMPTS", "SIZE", "UPDATED", "REASON");
    for (const auto& r : records)
        fmt::print("{:<48} {:<20} {:>8} {:>10} {:<20} {}\n", r.run_name, toString(r.status), r.attempts,
                   r.bytes ? nsync::util::bytesToSize(r.bytes) : "-",
                   nsync::util::timestampToString(r.updated_at), r.reason);
}

int resetRun(SyncState& state, const std::string& name, const bool force) {
    const auto before = state.getStatus(name);
    if (!state.reset(name, force)) {
        if (before == Status::UNKNOWN)
            Registry::nanosync()->error("[-] Run '{}' is not known to {}", name, state.path().string());
        else
            Registry::nanosync()->error("[-] Run '{}' is {}; nothing to reset{}", name, toString(before),
                                        before == Status::SYNCED ? " (use --force)" : "");
        return EXIT_FAILURE;
    }
    Registry::nanosync()->info("[✓] Run '{}' reset from {} to pending", name, toString(before));
    return EXIT_SUCCESS;
}

int watch(const Config& config, SyncState& state) {
    WatchLoop loop(config.watch, state, std::make_shared<FilesystemCopier>());

    Registry::nanosync()->info("[*] Syncing '{}' into '{}' (verify: {}, workers: {})",
                               config.watch.source.string(), config.watch.destination.string(),
                               config.watch.verify, config.watch.transfer_workers);
    loop.start();

    while (!shouldExit && loop.isRunning()) {
        if (reopenLogs.exchange(false)) Registry::reopenMainLog();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Registry::nanosync()->info("[*] Shutting down, waiting for running transfers to stop...");
    loop.stop();
    Registry::nanosync()->info("[✓] nanosync shut down cleanly.");
    return EXIT_SUCCESS;
}
}

int main(const int argc, char* argv[]) {
    CommandLine cl;
    try {
        cl = CommandLine::parse(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "nanosync: " << e.what() << "\nTry 'nanosync --help' for more information.\n";
        return EXIT_USAGE;
    } catch (const ConfigError& e) {
        std::cerr << "nanosync: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    if (cl.action == CommandLine::Action::HELP) {
        std::cout << cl.help << std::endl;
        return EXIT_SUCCESS;
    }

    try {
        Registry::init(cl.config.logging);
    } catch (const std::exception& e) {
        std::cerr << "nanosync: unable to set up logging: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    try {
        if (cl.action == CommandLine::Action::WATCH) cl.config.validate();

        SyncState state(cl.config.watch.stateFilePath());
        Registry::nanosync()->debug("[*] Sync state loaded from {}", state.path().string());

        switch (cl.action) {
            case CommandLine::Action::LIST:  printRecords(state); rc = EXIT_SUCCESS; break;
            case CommandLine::Action::RESET: rc = resetRun(state, cl.reset_run, cl.force); break;
            default:
                std::signal(SIGINT, signalHandler);
                std::signal(SIGTERM, signalHandler);
                std::signal(SIGHUP, signalHandler);
                rc = watch(cl.config, state);
                break;
        }
    } catch (const ConfigError& e) {
        Registry::nanosync()->error("[-] Configuration error: {}", e.what());
    } catch (const std::exception& e) {
        Registry::nanosync()->error("[-] nanosync failed: {}", e.what());
    }

    Registry::shutdown();
    return rc;
}
