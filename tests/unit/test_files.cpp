#include "TestTree.hpp"
#include "util/files.hpp"

using namespace nsync::util;
using namespace nsync::test;

class FilesTest : public TempTreeTest {};

TEST_F(FilesTest, DurableWriteReplacesContent) {
    const auto file = root / "state.yaml";
    writeFileDurably(file, "first\n");
    writeFileDurably(file, "second\n");
    EXPECT_EQ(readFileToString(file), "second\n");

    size_t entries = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(root)) ++entries;
    EXPECT_EQ(entries, 3u);  // source, destination, state.yaml
}

TEST_F(FilesTest, DurableWriteIntoMissingDirectoryThrows) {
    EXPECT_THROW(writeFileDurably(root / "missing" / "state.yaml", "x"), fs::filesystem_error);
}

TEST_F(FilesTest, DirectorySizeCountsRegularFilesOnly) {
    makeRun(RUN_A);
    fs::create_symlink(source / RUN_A / "pod5" / "reads_0.pod5", source / RUN_A / "link.pod5");
    fs::create_directories(source / RUN_A / "empty");
    EXPECT_EQ(directorySize(source / RUN_A), 4096u + 2048u + 1000u + 2u);
    EXPECT_EQ(directorySize(destination), 0u);
    EXPECT_THROW((void)directorySize(root / "missing"), fs::filesystem_error);
}

TEST_F(FilesTest, BytesToSize) {
    EXPECT_EQ(bytesToSize(512), "512B");
    EXPECT_EQ(bytesToSize(1024), "1KB");
    EXPECT_EQ(bytesToSize(1536), "1.5KB");
    EXPECT_EQ(bytesToSize(5ull * 1024 * 1024 * 1024), "5GB");
}
