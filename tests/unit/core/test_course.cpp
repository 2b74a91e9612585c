#include <gtest/gtest.h>

#include "noter/core/course.hpp"
#include "test_helpers.hpp"

namespace noter::core {

TEST(CourseCodeTest, AcceptsTypicalCodes) {
    EXPECT_OK(validateCourseCode("EAS103"));
    EXPECT_OK(validateCourseCode("csc263"));
    EXPECT_OK(validateCourseCode("MAT_137"));
    EXPECT_OK(validateCourseCode("PHY1.5"));
    EXPECT_OK(validateCourseCode(std::string(kMaxCourseCodeLength, 'A')));
}

TEST(CourseCodeTest, RejectsInvalidCodes) {
    EXPECT_ERROR(validateCourseCode(""), ErrorCode::kInvalidArgument);
    EXPECT_ERROR(validateCourseCode("EAS-103"), ErrorCode::kInvalidArgument);
    EXPECT_ERROR(validateCourseCode("EAS 103"), ErrorCode::kInvalidArgument);
    EXPECT_ERROR(validateCourseCode("../etc"), ErrorCode::kInvalidArgument);
    EXPECT_ERROR(validateCourseCode("a/b"), ErrorCode::kInvalidArgument);
    EXPECT_ERROR(validateCourseCode(".hidden"), ErrorCode::kInvalidArgument);
    EXPECT_ERROR(validateCourseCode(std::string(kMaxCourseCodeLength + 1, 'A')),
                 ErrorCode::kInvalidArgument);
}

TEST(CourseDirectoryTest, NameFromCodeAndTitle) {
    auto name = courseDirectoryName("EAS103", "Premodern East Asia");
    ASSERT_OK(name);
    EXPECT_EQ(*name, "EAS103-premodern-east-asia");
}

TEST(CourseDirectoryTest, KeepsCodeCase) {
    auto name = courseDirectoryName("csc263", "Data Structures");
    ASSERT_OK(name);
    EXPECT_EQ(*name, "csc263-data-structures");
}

TEST(CourseDirectoryTest, EmptyTitleGivesBareCode) {
    auto name = courseDirectoryName("MAT137", "");
    ASSERT_OK(name);
    EXPECT_EQ(*name, "MAT137");

    auto punctuation = courseDirectoryName("MAT137", "???");
    ASSERT_OK(punctuation);
    EXPECT_EQ(*punctuation, "MAT137");
}

TEST(CourseDirectoryTest, InvalidCodeIsRejected) {
    EXPECT_ERROR(courseDirectoryName("EAS-103", "Title"), ErrorCode::kInvalidArgument);
}

TEST(CourseDirectoryTest, ParseSplitsOnFirstSeparator) {
    auto parts = parseCourseDirectory("EAS103-premodern-east-asia");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->code, "EAS103");
    EXPECT_EQ(parts->slug, "premodern-east-asia");

    auto bare = parseCourseDirectory("MAT137");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->code, "MAT137");
    EXPECT_TRUE(bare->slug.empty());
}

TEST(CourseDirectoryTest, ParseRejectsNonCourseFolders) {
    EXPECT_FALSE(parseCourseDirectory(".git").has_value());
    EXPECT_FALSE(parseCourseDirectory("-leading").has_value());
    EXPECT_FALSE(parseCourseDirectory("has space-x").has_value());
    EXPECT_FALSE(parseCourseDirectory("").has_value());
}

TEST(CourseDirectoryTest, ParsedCodeComparesWholeCode) {
    auto parts = parseCourseDirectory("EAS1030-other");
    ASSERT_TRUE(parts.has_value());
    EXPECT_FALSE(sameCourseCode(parts->code, "EAS103"));
    EXPECT_TRUE(sameCourseCode(parts->code, "eas1030"));
}

TEST(CourseDirectoryTest, SameCourseCode) {
    EXPECT_TRUE(sameCourseCode("CSC263", "csc263"));
    EXPECT_FALSE(sameCourseCode("CSC263", "CSC2630"));
    EXPECT_FALSE(sameCourseCode("CSC263", "CSC264"));
}

}  // namespace noter::core
