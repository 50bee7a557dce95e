#include "config/CommandLine.hpp"

#include <boost/program_options.hpp>
#include <fmt/core.h>
#include <sstream>
#include <string>

namespace po = boost::program_options;

namespace nsync::config {

namespace {

po::options_description describe() {
    po::options_description watch("Watch options");
    watch.add_options()
        ("source,s", po::value<std::string>()->value_name("DIR"), "Directory containing nanopore runs (required)")
        ("destination,d", po::value<std::string>()->value_name("DIR"), "Directory runs are synced into (required)")
        ("verify", po::bool_switch(), "Compare the total size of source and copy (default)")
        ("no-verify", po::bool_switch(), "Skip the size comparison after copy")
        ("run-name-pattern", po::value<std::string>()->value_name("REGEX"),
            ("Pattern run directory names must match [" + std::string(DEFAULT_RUN_NAME_PATTERN) + "]").c_str())
        ("completion-signal-pattern", po::value<std::string>()->value_name("REGEX"),
            ("Pattern of the file that marks a finished run [" + std::string(DEFAULT_COMPLETION_SIGNAL_PATTERN) + "]").c_str())
        ("poll-interval", po::value<long>()->value_name("SECONDS"), "Seconds between scans [30]")
        ("completion-delay", po::value<long>()->value_name("SECONDS"),
            "Seconds to wait after the completion signal before copying [0]")
        ("workers", po::value<long>()->value_name("N"), "Concurrent transfers, 1 to 64 [1]")
        ("state-file", po::value<std::string>()->value_name("PATH"),
            "Sync state file [<destination>/.nanosync/state.yaml]");

    po::options_description logging("Logging options");
    logging.add_options()
        ("log-dir", po::value<std::string>()->value_name("DIR"), "Write nanosync.log and audit.log here")
        ("log-level", po::value<std::string>()->value_name("LEVEL"), "Console log level: trace..off [info]");

    po::options_description general("General options");
    general.add_options()
        ("config,c", po::value<std::string>()->value_name("FILE"), "YAML config file; flags override its values")
        ("list", po::bool_switch(), "Print all sync records and exit")
        ("reset", po::value<std::string>()->value_name("RUN"), "Reset a failed run to pending and exit")
        ("force", po::bool_switch(), "With --reset, also reset a synced run")
        ("help,h", "Show this help");

    po::options_description all("Usage: nanosync --source DIR --destination DIR [options]");
    all.add(watch).add(logging).add(general);
    return all;
}

template <typename T>
bool take(const po::variables_map& vm, const char* key, T& out) {
    if (!vm.count(key)) return false;
    out = vm[key].as<T>();
    return true;
}

}

CommandLine CommandLine::parse(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    argv.push_back("nanosync");
    for (const auto& a : args) argv.push_back(a.c_str());
    return parse(static_cast<int>(argv.size()), argv.data());
}

CommandLine CommandLine::parse(const int argc, const char* const argv[]) {
    const auto desc = describe();
    po::variables_map vm;

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    CommandLine cl;

    if (vm.count("help")) {
        std::ostringstream oss;
        oss << desc;
        cl.action = Action::HELP;
        cl.help = oss.str();
        return cl;
    }

    if (vm.count("config")) cl.config = loadConfig(vm["config"].as<std::string>());

    auto& w = cl.config.watch;
    std::string s;
    if (take(vm, "source", s)) w.source = s;
    if (take(vm, "destination", s)) w.destination = s;
    if (take(vm, "state-file", s)) w.state_file = s;
    take(vm, "run-name-pattern", w.run_name_pattern);
    take(vm, "completion-signal-pattern", w.completion_signal_pattern);
    if (long workers = 0; take(vm, "workers", workers)) {
        if (workers < 1 || workers > MAX_TRANSFER_WORKERS)
            throw UsageError(fmt::format("--workers must be between 1 and {}", MAX_TRANSFER_WORKERS));
        w.transfer_workers = static_cast<unsigned int>(workers);
    }

    long seconds = 0;
    if (take(vm, "poll-interval", seconds)) w.poll_interval = std::chrono::seconds(seconds);
    if (take(vm, "completion-delay", seconds)) w.completion_delay = std::chrono::seconds(seconds);

    const bool verify = vm["verify"].as<bool>(), noVerify = vm["no-verify"].as<bool>();
    if (verify && noVerify) throw UsageError("--verify and --no-verify are mutually exclusive");
    if (verify) w.verify = true;
    if (noVerify) w.verify = false;

    if (take(vm, "log-dir", s)) cl.config.logging.log_dir = s;
    if (take(vm, "log-level", s)) cl.config.logging.console_log_level = parseLogLevel(s);

    cl.force = vm["force"].as<bool>();
    if (take(vm, "reset", cl.reset_run)) cl.action = Action::RESET;
    if (vm["list"].as<bool>()) {
        if (cl.action == Action::RESET) throw UsageError("--list and --reset are mutually exclusive");
        cl.action = Action::LIST;
    }
    if (cl.force && cl.action != Action::RESET) throw UsageError("--force only applies to --reset");

    if (cl.action == Action::WATCH) {
        if (w.source.empty()) throw UsageError("the option '--source' is required");
        if (w.destination.empty()) throw UsageError("the option '--destination' is required");
    } else if (w.destination.empty() && w.state_file.empty()) {
        throw UsageError("--destination or --state-file is required to locate the sync state");
    }

    return cl;
}

}
