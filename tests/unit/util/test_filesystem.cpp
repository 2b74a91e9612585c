#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <sys/stat.h>
#include <unistd.h>

#include "noter/util/filesystem.hpp"
#include "test_helpers.hpp"

namespace noter::util {

class FileSystemTest : public noter::test::TempDirTest {};

TEST_F(FileSystemTest, CreateDirectoryExclusive) {
    auto dir = temp_dir_ / "EAS103";
    ASSERT_OK(FileSystem::createDirectoryExclusive(dir));
    EXPECT_TRUE(std::filesystem::is_directory(dir));

    EXPECT_ERROR(FileSystem::createDirectoryExclusive(dir), ErrorCode::kAlreadyExists);
}

TEST_F(FileSystemTest, CreateDirectoryOverFileFails) {
    auto path = temp_dir_ / "taken";
    ASSERT_OK(FileSystem::createFileExclusive(path, "x"));
    EXPECT_ERROR(FileSystem::createDirectoryExclusive(path), ErrorCode::kAlreadyExists);
}

TEST_F(FileSystemTest, CreateDirectoryWithoutParentFails) {
    auto result = FileSystem::createDirectoryExclusive(temp_dir_ / "missing" / "child");
    EXPECT_FALSE(result.has_value());
}

TEST_F(FileSystemTest, CreateFileExclusiveWritesContent) {
    auto path = temp_dir_ / "note.md";
    ASSERT_OK(FileSystem::createFileExclusive(path, "# Hello\n"));
    EXPECT_EQ(noter::test::readFile(path), "# Hello\n");
}

TEST_F(FileSystemTest, CreateFileExclusiveNeverTruncates) {
    auto path = temp_dir_ / "note.md";
    ASSERT_OK(FileSystem::createFileExclusive(path, "original"));
    EXPECT_ERROR(FileSystem::createFileExclusive(path, "replacement"), ErrorCode::kAlreadyExists);
    EXPECT_EQ(noter::test::readFile(path), "original");
}

TEST_F(FileSystemTest, CreateFileExclusiveEmptyContent) {
    auto path = temp_dir_ / "empty.md";
    ASSERT_OK(FileSystem::createFileExclusive(path, ""));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 0u);
}

TEST_F(FileSystemTest, PermissionDeniedIsReported) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root bypasses directory permissions";
    }
    auto dir = temp_dir_ / "locked";
    ASSERT_OK(FileSystem::createDirectoryExclusive(dir));
    ASSERT_EQ(chmod(dir.c_str(), 0555), 0);

    EXPECT_ERROR(FileSystem::createFileExclusive(dir / "note.md", "x"), ErrorCode::kFilePermissionDenied);

    chmod(dir.c_str(), 0755);
}

TEST_F(FileSystemTest, WriteFileAtomicReplacesContent) {
    auto path = temp_dir_ / "nested" / "config.toml";
    ASSERT_OK(FileSystem::writeFileAtomic(path, "first"));
    ASSERT_OK(FileSystem::writeFileAtomic(path, "second"));
    EXPECT_EQ(noter::test::readFile(path), "second");

    // No temp files left behind
    EXPECT_EQ(noter::test::listNames(path.parent_path()), std::vector<std::string>{"config.toml"});
}

TEST_F(FileSystemTest, DirectoryLockExcludesOtherHolders) {
    auto lock = DirectoryLock::acquire(temp_dir_);
    ASSERT_OK(lock);

    std::atomic<bool> acquired{false};
    std::thread waiter([this, &acquired] {
        auto second = DirectoryLock::acquire(temp_dir_);
        EXPECT_TRUE(second.has_value());
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());

    // Destroying the holder releases the lock
    { auto released = std::move(*lock); }
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST_F(FileSystemTest, DirectoryLockOnMissingDirectoryFails) {
    EXPECT_ERROR(DirectoryLock::acquire(temp_dir_ / "missing"), ErrorCode::kIoError);
}

TEST_F(FileSystemTest, ListDirectoryReportsTypes) {
    ASSERT_OK(FileSystem::createDirectoryExclusive(temp_dir_ / "CSC263-data-structures"));
    ASSERT_OK(FileSystem::createFileExclusive(temp_dir_ / "readme.md", ""));

    auto entries = FileSystem::listDirectory(temp_dir_);
    ASSERT_OK(entries);
    ASSERT_EQ(entries->size(), 2u);

    for (const auto& entry : *entries) {
        if (entry.name == "CSC263-data-structures") {
            EXPECT_EQ(entry.type, EntryType::kDirectory);
        } else {
            EXPECT_EQ(entry.name, "readme.md");
            EXPECT_EQ(entry.type, EntryType::kFile);
        }
    }
}

TEST_F(FileSystemTest, ListMissingDirectoryFails) {
    EXPECT_FALSE(FileSystem::listDirectory(temp_dir_ / "nope").has_value());
}

}  // namespace noter::util
