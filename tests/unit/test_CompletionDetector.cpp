#include "TestTree.hpp"
#include "config/Config.hpp"
#include "sync/CompletionDetector.hpp"

using namespace nsync::sync;
using namespace nsync::test;

class CompletionDetectorTest : public TempTreeTest {
protected:
    CompletionDetector detector{nsync::config::DEFAULT_COMPLETION_SIGNAL_PATTERN};
};

TEST_F(CompletionDetectorTest, RunWithoutSummaryIsIncomplete) {
    const auto run = makeRun(RUN_A);
    const auto d = detector.detect(run);
    EXPECT_EQ(d.state, Detection::State::INCOMPLETE);
    EXPECT_FALSE(d.complete());
    EXPECT_FALSE(d.failed());
}

TEST_F(CompletionDetectorTest, FinalSummaryMarksRunComplete) {
    const auto run = makeRun(RUN_A);
    finishRun(RUN_A);

    const auto d = detector.detect(run);
    ASSERT_TRUE(d.complete());
    EXPECT_EQ(d.signal.filename(), "final_summary_0a1b2c3d.txt");
}

TEST_F(CompletionDetectorTest, SignalFoundInNestedDirectory) {
    const auto run = makeRun(RUN_A);
    writeFile(run / "no_sample" / "flowcell" / "final_summary_FAQ12345.txt", "done");

    EXPECT_TRUE(detector.detect(run).complete());
}

TEST_F(CompletionDetectorTest, DirectoryNamedLikeSignalIsIgnored) {
    const auto run = makeRun(RUN_A);
    fs::create_directories(run / "final_summary.txt");

    EXPECT_FALSE(detector.detect(run).complete());
}

TEST_F(CompletionDetectorTest, SimilarNamesDoNotMatch) {
    const auto run = makeRun(RUN_A);
    writeFile(run / "final_summary.txt.tmp", "");
    writeFile(run / "sequencing_summary.txt", "");
    writeFile(run / "prefinal_summary.txt", "");

    EXPECT_FALSE(detector.detect(run).complete());
}

TEST_F(CompletionDetectorTest, UnreadableRunIsAnError) {
    const auto d = detector.detect(source / RUN_B);
    EXPECT_TRUE(d.failed());
    EXPECT_FALSE(d.error.empty());
}

TEST_F(CompletionDetectorTest, InterruptStopsTheWalk) {
    const auto flag = std::make_shared<std::atomic<bool>>(true);
    const CompletionDetector interrupted(nsync::config::DEFAULT_COMPLETION_SIGNAL_PATTERN, flag);
    const auto run = makeRun(RUN_A);
    finishRun(RUN_A);

    const auto d = interrupted.detect(run);
    EXPECT_TRUE(d.failed());
    EXPECT_EQ(d.error, "interrupted");
}
