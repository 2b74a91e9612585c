#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "noter/config/config.hpp"
#include "noter/store/notes_root.hpp"
#include "test_helpers.hpp"

namespace noter::store {

class NotesRootTest : public noter::test::TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        // TempDirTest paths may go through symlinks (/tmp on macOS)
        temp_dir_ = std::filesystem::canonical(temp_dir_);
    }

    std::filesystem::path makeDir(const std::filesystem::path& relative) {
        auto dir = temp_dir_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }
};

TEST_F(NotesRootTest, CommandLineWins) {
    NotesRootLocator::Options options;
    options.command_line = makeDir("cli");
    options.environment = makeDir("env");
    options.configured = makeDir("config");
    options.start_dir = temp_dir_;

    auto root = NotesRootLocator::locate(options);
    ASSERT_OK(root);
    EXPECT_EQ(root->path, temp_dir_ / "cli");
    EXPECT_EQ(root->source, RootSource::kCommandLine);
}

TEST_F(NotesRootTest, EnvironmentBeforeConfig) {
    NotesRootLocator::Options options;
    options.environment = makeDir("env");
    options.configured = makeDir("config");
    options.start_dir = temp_dir_;

    auto root = NotesRootLocator::locate(options);
    ASSERT_OK(root);
    EXPECT_EQ(root->path, temp_dir_ / "env");
    EXPECT_EQ(root->source, RootSource::kEnvironment);
}

TEST_F(NotesRootTest, ConfigBeforeMarker) {
    ASSERT_OK(NotesRootLocator::initialize(temp_dir_));
    NotesRootLocator::Options options;
    options.configured = makeDir("config");
    options.start_dir = temp_dir_;

    auto root = NotesRootLocator::locate(options);
    ASSERT_OK(root);
    EXPECT_EQ(root->path, temp_dir_ / "config");
    EXPECT_EQ(root->source, RootSource::kConfig);
    EXPECT_TRUE(root->marker_file.empty());
}

TEST_F(NotesRootTest, TrailingSlashIsNormalized) {
    auto dir = makeDir("notes");
    NotesRootLocator::Options options;
    options.command_line = dir.string() + "/";

    auto root = NotesRootLocator::locate(options);
    ASSERT_OK(root);
    EXPECT_EQ(root->path, dir);
}

TEST_F(NotesRootTest, ExplicitRootMustExist) {
    NotesRootLocator::Options options;
    options.command_line = temp_dir_ / "missing";
    EXPECT_ERROR(NotesRootLocator::locate(options), ErrorCode::kInvalidArgument);

    std::ofstream(temp_dir_ / "file.txt") << "x";
    options.command_line = temp_dir_ / "file.txt";
    EXPECT_ERROR(NotesRootLocator::locate(options), ErrorCode::kInvalidArgument);
}

TEST_F(NotesRootTest, MarkerFoundFromNestedDirectory) {
    auto root_dir = makeDir("school");
    ASSERT_OK(NotesRootLocator::initialize(root_dir));
    auto nested = makeDir("school/CSC263-data-structures/week1");

    NotesRootLocator::Options options;
    options.start_dir = nested;

    auto root = NotesRootLocator::locate(options);
    ASSERT_OK(root);
    EXPECT_EQ(root->path, root_dir);
    EXPECT_EQ(root->source, RootSource::kMarker);
    EXPECT_EQ(root->marker_file, root_dir / NotesRootLocator::kMarkerFileName);
}

TEST_F(NotesRootTest, FallsBackToStartDirectory) {
    auto dir = makeDir("plain");
    NotesRootLocator::Options options;
    options.start_dir = dir;

    auto root = NotesRootLocator::locate(options);
    ASSERT_OK(root);
    // A marker further up (e.g. in $HOME) would be found first; none is expected under /tmp
    if (root->source == RootSource::kWorkingDirectory) {
        EXPECT_EQ(root->path, dir);
    }
}

TEST_F(NotesRootTest, FindMarkerRootStopsAtNearest) {
    auto outer = makeDir("outer");
    auto inner = makeDir("outer/inner");
    ASSERT_OK(NotesRootLocator::initialize(outer));
    ASSERT_OK(NotesRootLocator::initialize(inner));

    auto found = NotesRootLocator::findMarkerRoot(inner / "deeper");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, inner);
}

TEST_F(NotesRootTest, InitializeWritesLoadableMarker) {
    auto marker = NotesRootLocator::initialize(temp_dir_);
    ASSERT_OK(marker);
    EXPECT_EQ(*marker, temp_dir_ / NotesRootLocator::kMarkerFileName);

    // The template only holds comments, so loading it changes nothing
    config::Config config;
    ASSERT_OK(config.load(*marker));
    EXPECT_EQ(config.notes.extension, "md");
}

TEST_F(NotesRootTest, InitializeTwiceFails) {
    ASSERT_OK(NotesRootLocator::initialize(temp_dir_));
    EXPECT_ERROR(NotesRootLocator::initialize(temp_dir_), ErrorCode::kAlreadyExists);
}

TEST_F(NotesRootTest, InitializeMissingDirectoryFails) {
    EXPECT_ERROR(NotesRootLocator::initialize(temp_dir_ / "missing"), ErrorCode::kInvalidArgument);
}

}  // namespace noter::store
