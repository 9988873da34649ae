#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <ctime>
#include "core/Archiver.hpp"
#include "TestSupport.hpp"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class ArchiverTest : public ::testing::Test {
protected:
    fs::path testDir;
    fs::path sortedDir;
    fs::path archiveDir;
    NiceMock<MockLogger> logger;

    void SetUp() override {
        testDir = uniqueTestDirectory("filesorter_archiver");
        sortedDir = testDir / "sorted";
        archiveDir = testDir / "archive";
        fs::remove_all(testDir);
        fs::create_directories(sortedDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }
};

TEST_F(ArchiverTest, CopiesIntoTodaysFolder) {
    writeFile(sortedDir / "photo.jpg", "pixels");
    Archiver archiver(&logger);

    EXPECT_CALL(logger, info(HasSubstr("Archived"))).Times(1);
    ASSERT_TRUE(archiver.archive(sortedDir / "photo.jpg", archiveDir));

    fs::path copy = archiveDir / Archiver::dateFolderName() / "photo.jpg";
    EXPECT_TRUE(fs::exists(copy));
    EXPECT_EQ(readFile(copy), "pixels");
    // 归档是复制，原文件保持不变
    EXPECT_TRUE(fs::exists(sortedDir / "photo.jpg"));
}

TEST_F(ArchiverTest, PreservesModificationTime) {
    fs::path source = sortedDir / "old.pdf";
    writeFile(source, "pdf");
    auto past = fs::last_write_time(source) - std::chrono::hours(48);
    fs::last_write_time(source, past);

    Archiver archiver(&logger);
    ASSERT_TRUE(archiver.archive(source, archiveDir));

    fs::path copy = archiveDir / Archiver::dateFolderName() / "old.pdf";
    EXPECT_EQ(fs::last_write_time(copy), past);
}

// 同一天同名文件直接覆盖，不做重命名
TEST_F(ArchiverTest, SameNameSameDayOverwrites) {
    Archiver archiver(&logger);

    writeFile(sortedDir / "notes.txt", "first");
    ASSERT_TRUE(archiver.archive(sortedDir / "notes.txt", archiveDir));

    fs::create_directories(sortedDir / "other");
    writeFile(sortedDir / "other" / "notes.txt", "second");
    ASSERT_TRUE(archiver.archive(sortedDir / "other" / "notes.txt", archiveDir));

    fs::path dayDir = archiveDir / Archiver::dateFolderName();
    EXPECT_EQ(readFile(dayDir / "notes.txt"), "second");
    EXPECT_FALSE(fs::exists(dayDir / "notes 1.txt"));
}

TEST_F(ArchiverTest, MissingSourceIsReportedNotThrown) {
    Archiver archiver(&logger);

    EXPECT_CALL(logger, error(HasSubstr("Error archiving file"))).Times(1);
    bool result = true;
    EXPECT_NO_THROW(result = archiver.archive(sortedDir / "vanished.jpg", archiveDir));
    EXPECT_FALSE(result);
}

TEST_F(ArchiverTest, UnwritableArchiveRootIsReported) {
    writeFile(sortedDir / "photo.jpg", "pixels");
    // 归档根目录位置被普通文件占用，无法创建日期目录
    writeFile(archiveDir, "not a directory");

    Archiver archiver(&logger);
    EXPECT_CALL(logger, error(_)).Times(1);
    EXPECT_FALSE(archiver.archive(sortedDir / "photo.jpg", archiveDir));
    EXPECT_TRUE(fs::exists(sortedDir / "photo.jpg"));
}

TEST_F(ArchiverTest, ExistingDateFolderIsReused) {
    fs::create_directories(archiveDir / Archiver::dateFolderName());
    writeFile(sortedDir / "a.png", "a");

    Archiver archiver(&logger);
    EXPECT_TRUE(archiver.archive(sortedDir / "a.png", archiveDir));
    EXPECT_TRUE(fs::exists(archiveDir / Archiver::dateFolderName() / "a.png"));
}

TEST(ArchiverDateTest, DateFolderNameFormat) {
    std::tm when{};
    when.tm_year = 2024 - 1900;
    when.tm_mon = 2;
    when.tm_mday = 5;
    when.tm_hour = 12;
    when.tm_isdst = -1;
    auto timePoint = std::chrono::system_clock::from_time_t(std::mktime(&when));

    EXPECT_EQ(Archiver::dateFolderName(timePoint), "2024-03-05");
}
