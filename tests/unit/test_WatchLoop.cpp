#include "TestTree.hpp"
#include "config/Config.hpp"
#include "sync/SyncState.hpp"
#include "sync/WatchLoop.hpp"
#include "util/files.hpp"

#include <chrono>
#include <thread>

using namespace nsync::sync;
using namespace nsync::sync::model;
using namespace nsync::test;
using namespace std::chrono_literals;

namespace {

// Fails the first copy of every run, then behaves
class FlakyCopier final : public CountingCopier {
public:
    void copyTree(const fs::path& from, const fs::path& to,
                  const std::shared_ptr<std::atomic<bool>>& interruptFlag) override {
        const bool first = copiesOf(from.filename().string()) == 0;
        CountingCopier::copyTree(from, to, interruptFlag);
        if (first) throw std::runtime_error("Input/output error");
    }
};

}

class WatchLoopTest : public TempTreeTest {
protected:
    nsync::config::WatchConfig cfg;
    std::unique_ptr<SyncState> state;

    void SetUp() override {
        TempTreeTest::SetUp();
        cfg.source = source;
        cfg.destination = destination;
        cfg.poll_interval = 1s;
        state = std::make_unique<SyncState>(cfg.stateFilePath());
    }

    std::unique_ptr<WatchLoop> makeLoop(std::shared_ptr<Copier> copier) const {
        return std::make_unique<WatchLoop>(cfg, *state, std::move(copier));
    }
};

TEST_F(WatchLoopTest, IncompleteRunStaysPending) {
    makeRun(RUN_A);
    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    for (int i = 0; i < 3; ++i) {
        const auto report = loop->pollOnce();
        EXPECT_EQ(report.candidates, 1u);
        EXPECT_EQ(report.waiting, 1u);
        EXPECT_EQ(report.started, 0u);
    }

    EXPECT_EQ(state->getStatus(RUN_A), Status::PENDING);
    EXPECT_EQ(copier->copies(), 0u);
    EXPECT_FALSE(fs::exists(destination / RUN_A));
}

TEST_F(WatchLoopTest, CompletedRunIsSyncedExactlyOnce) {
    makeRun(RUN_A);
    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    (void)loop->pollOnce();
    finishRun(RUN_A);

    const auto report = loop->pollOnce();
    EXPECT_EQ(report.started, 1u);
    EXPECT_EQ(report.synced, 1u);
    EXPECT_EQ(state->getStatus(RUN_A), Status::SYNCED);
    EXPECT_EQ(nsync::util::directorySize(destination / RUN_A), nsync::util::directorySize(source / RUN_A));

    for (int i = 0; i < 3; ++i) EXPECT_EQ(loop->pollOnce().started, 0u);
    EXPECT_EQ(copier->copiesOf(RUN_A), 1u);
    EXPECT_EQ(state->record(RUN_A)->attempts, 1u);
}

TEST_F(WatchLoopTest, VerificationFailureIsNotRetried) {
    makeRun(RUN_A);
    finishRun(RUN_A);
    const auto copier = std::make_shared<TruncatingCopier>();
    const auto loop = makeLoop(copier);

    EXPECT_EQ(loop->pollOnce().verification_failed, 1u);
    EXPECT_EQ(loop->pollOnce().started, 0u);

    EXPECT_EQ(state->getStatus(RUN_A), Status::VERIFICATION_FAILED);
    EXPECT_EQ(copier->copies(), 1u);
    EXPECT_TRUE(fs::exists(destination / RUN_A));
}

TEST_F(WatchLoopTest, TransferFailureIsRetriedNextCycle) {
    makeRun(RUN_A);
    finishRun(RUN_A);
    const auto copier = std::make_shared<FlakyCopier>();
    const auto loop = makeLoop(copier);

    EXPECT_EQ(loop->pollOnce().transfer_failed, 1u);
    EXPECT_EQ(state->getStatus(RUN_A), Status::TRANSFER_FAILED);

    EXPECT_EQ(loop->pollOnce().synced, 1u);
    EXPECT_EQ(state->getStatus(RUN_A), Status::SYNCED);
    EXPECT_EQ(state->record(RUN_A)->attempts, 2u);
    EXPECT_EQ(copier->copiesOf(RUN_A), 2u);
}

TEST_F(WatchLoopTest, NonMatchingDirectoriesAreIgnored) {
    fs::create_directories(source / "calibration");
    writeFile(source / "calibration" / "final_summary_x.txt", "");
    fs::create_directories(source / "20240101_1200_MN12345_FAQ12345");
    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    const auto report = loop->pollOnce();
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_TRUE(state->records().empty());
    EXPECT_EQ(copier->copies(), 0u);
}

TEST_F(WatchLoopTest, RestartAfterCrashTransfersOnce) {
    makeRun(RUN_A);
    finishRun(RUN_A);

    // a previous process admitted the run and died halfway through the copy
    ASSERT_TRUE(state->tryBeginTransfer(RUN_A));
    writeFile(destination / ("." + std::string(RUN_A) + ".partial") / "pod5" / "reads_0.pod5", "partial");
    state.reset();
    state = std::make_unique<SyncState>(cfg.stateFilePath());
    ASSERT_EQ(state->getStatus(RUN_A), Status::TRANSFERRING);

    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    EXPECT_EQ(loop->pollOnce().synced, 1u);
    EXPECT_EQ(loop->pollOnce().started, 0u);
    EXPECT_EQ(copier->copiesOf(RUN_A), 1u);
    EXPECT_EQ(state->getStatus(RUN_A), Status::SYNCED);
    EXPECT_EQ(state->record(RUN_A)->attempts, 2u);
    EXPECT_EQ(nsync::util::directorySize(destination / RUN_A), nsync::util::directorySize(source / RUN_A));
}

TEST_F(WatchLoopTest, RestartAfterRenameReplacesOwnCopy) {
    makeRun(RUN_A);
    finishRun(RUN_A);

    // a previous process renamed its copy into place and died before recording the outcome
    ASSERT_TRUE(state->tryBeginTransfer(RUN_A));
    state->claimDestination(RUN_A);
    writeFile(destination / RUN_A / "pod5" / "reads_0.pod5", "stale");
    state.reset();
    state = std::make_unique<SyncState>(cfg.stateFilePath());

    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    EXPECT_EQ(loop->pollOnce().synced, 1u);
    EXPECT_EQ(copier->copiesOf(RUN_A), 1u);
    EXPECT_EQ(nsync::util::directorySize(destination / RUN_A), nsync::util::directorySize(source / RUN_A));
}

TEST_F(WatchLoopTest, ForeignDestinationSurvivesRetries) {
    makeRun(RUN_A);
    finishRun(RUN_A);
    writeFile(destination / RUN_A / "operator_data.txt", "do not touch");
    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    for (int cycle = 0; cycle < 3; ++cycle) {
        const auto report = loop->pollOnce();
        EXPECT_EQ(report.transfer_failed, 1u);
        EXPECT_EQ(report.synced, 0u);
    }

    EXPECT_EQ(state->getStatus(RUN_A), Status::TRANSFER_FAILED);
    EXPECT_EQ(state->record(RUN_A)->reason, "destination already exists");
    EXPECT_EQ(copier->copies(), 0u);
    EXPECT_EQ(nsync::util::readFileToString(destination / RUN_A / "operator_data.txt"), "do not touch");
}

TEST_F(WatchLoopTest, CompletionDelayPostponesTransfer) {
    cfg.completion_delay = 1s;
    makeRun(RUN_A);
    finishRun(RUN_A);
    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    const auto first = loop->pollOnce();
    EXPECT_EQ(first.waiting, 1u);
    EXPECT_EQ(first.started, 0u);

    std::this_thread::sleep_for(1100ms);
    EXPECT_EQ(loop->pollOnce().synced, 1u);
    EXPECT_EQ(copier->copies(), 1u);
}

TEST_F(WatchLoopTest, SeveralRunsWithSeveralWorkers) {
    cfg.transfer_workers = 2;
    for (const auto* name : {RUN_A, RUN_B}) {
        makeRun(name);
        finishRun(name);
    }
    const auto copier = std::make_shared<CountingCopier>();
    const auto loop = makeLoop(copier);

    const auto report = loop->pollOnce();
    EXPECT_EQ(report.candidates, 2u);
    EXPECT_EQ(report.synced, 2u);
    EXPECT_EQ(state->getStatus(RUN_A), Status::SYNCED);
    EXPECT_EQ(state->getStatus(RUN_B), Status::SYNCED);
}

TEST_F(WatchLoopTest, UnreachableSourceIsReportedNotFatal) {
    cfg.source = root / "unmounted";
    const auto loop = makeLoop(std::make_shared<CountingCopier>());

    const auto report = loop->pollOnce();
    EXPECT_EQ(report.candidates, 0u);
    EXPECT_EQ(report.errors, 1u);
}

TEST_F(WatchLoopTest, BackgroundLoopSyncsAndStopsPromptly) {
    cfg.poll_interval = 60s;
    makeRun(RUN_A);
    finishRun(RUN_A);
    const auto loop = makeLoop(std::make_shared<CountingCopier>());

    loop->start();
    for (int i = 0; i < 100 && state->getStatus(RUN_A) != Status::SYNCED; ++i)
        std::this_thread::sleep_for(50ms);
    EXPECT_EQ(state->getStatus(RUN_A), Status::SYNCED);

    const auto before = std::chrono::steady_clock::now();
    loop->stop();
    EXPECT_FALSE(loop->isRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - before, 5s);
}
