#include <gtest/gtest.h>
#include "core/PathNaming.hpp"
#include "TestSupport.hpp"

class PathNamingTest : public ::testing::Test {
protected:
    fs::path testDir;

    void SetUp() override {
        testDir = uniqueTestDirectory("filesorter_naming");
        fs::remove_all(testDir);
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(PathNamingTest, FreeNameIsReturnedUnchanged) {
    EXPECT_EQ(PathNaming::resolve(testDir, "report.txt"), testDir / "report.txt");
}

TEST_F(PathNamingTest, FirstCollisionGetsCounterOne) {
    writeFile(testDir / "report.txt", "original");
    EXPECT_EQ(PathNaming::resolve(testDir, "report.txt"), testDir / "report 1.txt");
}

TEST_F(PathNamingTest, RepeatedCollisionsIncrementCounter) {
    writeFile(testDir / "report.txt", "original");

    fs::path first = PathNaming::resolve(testDir, "report.txt");
    ASSERT_EQ(first, testDir / "report 1.txt");
    writeFile(first, "first copy");

    EXPECT_EQ(PathNaming::resolve(testDir, "report.txt"), testDir / "report 2.txt");
}

TEST_F(PathNamingTest, OccupiedSlotIsNeverReused) {
    writeFile(testDir / "report.txt", "original");
    writeFile(testDir / "report 1.txt", "first copy");
    EXPECT_EQ(PathNaming::resolve(testDir, "report.txt"), testDir / "report 2.txt");
}

// 只要原名被占用，就从1开始找第一个空位
TEST_F(PathNamingTest, FillsFirstGapInSequence) {
    writeFile(testDir / "report.txt", "original");
    writeFile(testDir / "report 2.txt", "second copy");
    EXPECT_EQ(PathNaming::resolve(testDir, "report.txt"), testDir / "report 1.txt");
}

TEST_F(PathNamingTest, NameWithoutExtension) {
    writeFile(testDir / "README", "text");
    EXPECT_EQ(PathNaming::resolve(testDir, "README"), testDir / "README 1");
}

TEST_F(PathNamingTest, OnlyLastExtensionIsSplit) {
    writeFile(testDir / "backup.tar.gz", "data");
    EXPECT_EQ(PathNaming::resolve(testDir, "backup.tar.gz"), testDir / "backup.tar 1.gz");
}

TEST_F(PathNamingTest, ExistingDirectoryCountsAsCollision) {
    fs::create_directories(testDir / "photos.zip");
    EXPECT_EQ(PathNaming::resolve(testDir, "photos.zip"), testDir / "photos 1.zip");
}

TEST_F(PathNamingTest, SameSnapshotGivesSameAnswer) {
    writeFile(testDir / "a.png", "x");
    EXPECT_EQ(PathNaming::resolve(testDir, "a.png"), PathNaming::resolve(testDir, "a.png"));
}
