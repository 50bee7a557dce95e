#include "TestTree.hpp"
#include "config/CommandLine.hpp"

using namespace nsync::config;
using namespace nsync::test;
using namespace std::chrono_literals;
using Action = CommandLine::Action;

class CommandLineTest : public TempTreeTest {};

TEST_F(CommandLineTest, MinimalWatch) {
    const auto cl = CommandLine::parse({"-s", "/data/runs", "-d", "/mnt/archive"});
    EXPECT_EQ(cl.action, Action::WATCH);
    EXPECT_EQ(cl.config.watch.source, "/data/runs");
    EXPECT_EQ(cl.config.watch.destination, "/mnt/archive");
    EXPECT_TRUE(cl.config.watch.verify);
    EXPECT_EQ(cl.config.watch.poll_interval, 30s);
}

TEST_F(CommandLineTest, AllWatchFlags) {
    const auto cl = CommandLine::parse({
        "--source", "/data/runs", "--destination", "/mnt/archive", "--no-verify",
        "--run-name-pattern", "run_[0-9]+", "--completion-signal-pattern", "DONE$",
        "--poll-interval", "5", "--completion-delay", "60", "--workers", "4",
        "--state-file", "/var/lib/nanosync/state.yaml", "--log-dir", "/var/log/nanosync", "--log-level", "debug"});

    const auto& w = cl.config.watch;
    EXPECT_FALSE(w.verify);
    EXPECT_EQ(w.run_name_pattern, "run_[0-9]+");
    EXPECT_EQ(w.completion_signal_pattern, "DONE$");
    EXPECT_EQ(w.poll_interval, 5s);
    EXPECT_EQ(w.completion_delay, 60s);
    EXPECT_EQ(w.transfer_workers, 4u);
    EXPECT_EQ(w.stateFilePath(), "/var/lib/nanosync/state.yaml");
    EXPECT_EQ(cl.config.logging.log_dir, "/var/log/nanosync");
    EXPECT_EQ(cl.config.logging.console_log_level, spdlog::level::debug);
}

TEST_F(CommandLineTest, FlagsOverrideConfigFile) {
    const auto file = root / "nanosync.yaml";
    writeFile(file,
              "watch:\n"
              "  source: /from/file\n"
              "  destination: /mnt/archive\n"
              "  verify: false\n"
              "  poll_interval_seconds: 300\n");

    const auto cl = CommandLine::parse({"-c", file.string(), "--source", "/from/flag", "--verify"});
    EXPECT_EQ(cl.config.watch.source, "/from/flag");
    EXPECT_EQ(cl.config.watch.destination, "/mnt/archive");
    EXPECT_TRUE(cl.config.watch.verify);
    EXPECT_EQ(cl.config.watch.poll_interval, 300s);
}

TEST_F(CommandLineTest, ListAndReset) {
    const auto list = CommandLine::parse({"--list", "-d", "/mnt/archive"});
    EXPECT_EQ(list.action, Action::LIST);

    const auto reset = CommandLine::parse({"--reset", "20240101_1200_MN12345_FAQ12345_0a1b2c3d", "--force",
                                           "--state-file", "/tmp/state.yaml"});
    EXPECT_EQ(reset.action, Action::RESET);
    EXPECT_EQ(reset.reset_run, "20240101_1200_MN12345_FAQ12345_0a1b2c3d");
    EXPECT_TRUE(reset.force);
}

TEST_F(CommandLineTest, HelpSkipsValidation) {
    const auto cl = CommandLine::parse({"--help"});
    EXPECT_EQ(cl.action, Action::HELP);
    EXPECT_NE(cl.help.find("--completion-signal-pattern"), std::string::npos);
}

TEST_F(CommandLineTest, UsageErrors) {
    EXPECT_THROW(CommandLine::parse({"-d", "/mnt/archive"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/data/runs"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--bogus"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--poll-interval", "soon"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--verify", "--no-verify"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--force"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-d", "/b", "--list", "--reset", "x"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"--list"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--workers", "-1"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--workers", "0"}), UsageError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--workers", "65"}), UsageError);
}

TEST_F(CommandLineTest, BadConfigFileOrLevelIsConfigError) {
    EXPECT_THROW(CommandLine::parse({"-c", (root / "missing.yaml").string()}), ConfigError);
    EXPECT_THROW(CommandLine::parse({"-s", "/a", "-d", "/b", "--log-level", "chatty"}), ConfigError);
}
