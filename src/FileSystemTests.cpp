#include <gtest/gtest.h>
#include <algorithm>
#include "utils/FileSystem.hpp"
#include "TestSupport.hpp"

class FileSystemTest : public ::testing::Test {
protected:
    fs::path testDir;

    void SetUp() override {
        testDir = uniqueTestDirectory("filesorter_fs");
        fs::remove_all(testDir);
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(FileSystemTest, Exists) {
    writeFile(testDir / "file.txt", "x");
    EXPECT_TRUE(FileSystem::exists(testDir / "file.txt"));
    EXPECT_TRUE(FileSystem::exists(testDir));
    EXPECT_FALSE(FileSystem::exists(testDir / "missing.txt"));
}

TEST_F(FileSystemTest, CreateDirectoriesIsIdempotent) {
    std::error_code ec;
    fs::path nested = testDir / "a" / "b" / "c";

    EXPECT_TRUE(FileSystem::createDirectories(nested, ec));
    EXPECT_FALSE(ec);
    EXPECT_TRUE(FileSystem::createDirectories(nested, ec));
    EXPECT_FALSE(ec);
    EXPECT_TRUE(fs::is_directory(nested));
}

TEST_F(FileSystemTest, CreateDirectoriesOverFileFails) {
    writeFile(testDir / "blocker", "x");
    std::error_code ec;
    EXPECT_FALSE(FileSystem::createDirectories(testDir / "blocker", ec));
    EXPECT_TRUE(ec);
}

TEST_F(FileSystemTest, CopyFileOverwritesExisting) {
    writeFile(testDir / "src.txt", "new");
    writeFile(testDir / "dst.txt", "old");

    std::error_code ec;
    EXPECT_TRUE(FileSystem::copyFile(testDir / "src.txt", testDir / "dst.txt", ec));
    EXPECT_EQ(readFile(testDir / "dst.txt"), "new");
    EXPECT_TRUE(fs::exists(testDir / "src.txt"));
}

TEST_F(FileSystemTest, CopyMissingSourceFails) {
    std::error_code ec;
    EXPECT_FALSE(FileSystem::copyFile(testDir / "missing.txt", testDir / "dst.txt", ec));
    EXPECT_TRUE(ec);
    EXPECT_FALSE(fs::exists(testDir / "dst.txt"));
}

TEST_F(FileSystemTest, MoveFileRenames) {
    fs::create_directories(testDir / "target");
    writeFile(testDir / "photo.jpg", "pixels");

    std::error_code ec;
    EXPECT_TRUE(FileSystem::moveFile(testDir / "photo.jpg", testDir / "target" / "photo.jpg", ec));
    EXPECT_FALSE(fs::exists(testDir / "photo.jpg"));
    EXPECT_EQ(readFile(testDir / "target" / "photo.jpg"), "pixels");
}

TEST_F(FileSystemTest, MoveMissingSourceFails) {
    std::error_code ec;
    EXPECT_FALSE(FileSystem::moveFile(testDir / "gone.jpg", testDir / "gone2.jpg", ec));
    EXPECT_TRUE(ec);
}

TEST_F(FileSystemTest, ListEntriesIsNotRecursive) {
    writeFile(testDir / "a.txt", "a");
    fs::create_directories(testDir / "sub");
    writeFile(testDir / "sub" / "b.txt", "b");

    std::error_code ec;
    auto entries = FileSystem::listEntries(testDir, ec);
    EXPECT_FALSE(ec);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_NE(std::find(entries.begin(), entries.end(), testDir / "a.txt"), entries.end());
    EXPECT_NE(std::find(entries.begin(), entries.end(), testDir / "sub"), entries.end());
}

TEST_F(FileSystemTest, ListMissingDirectoryReportsError) {
    std::error_code ec;
    auto entries = FileSystem::listEntries(testDir / "missing", ec);
    EXPECT_TRUE(ec);
    EXPECT_TRUE(entries.empty());
}
