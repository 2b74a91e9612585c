#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "noter/common.hpp"

namespace noter::core {

/**
 * @brief A course folder under the notes root
 *
 * On disk a course is one directory named "<code>-<slug(title)>", or just
 * "<code>" when the title has no usable characters.
 */
struct Course {
  std::string code;
  std::string title;                 // Display title; empty for courses read back from disk
  std::string slug;
  std::filesystem::path directory;

  std::string directoryName() const { return directory.filename().string(); }
};

// Code and slug recovered from a directory name
struct CourseDirectoryParts {
  std::string code;
  std::string slug;
};

inline constexpr size_t kMaxCourseCodeLength = 32;

/**
 * @brief Check that a course code is usable as a directory name prefix
 *
 * Codes are 1-32 ASCII letters, digits, '_' or '.', and may not start with
 * '.'. '-' is reserved as the code/title separator.
 */
Result<void> validateCourseCode(std::string_view code);

// Directory name for a new course
Result<std::string> courseDirectoryName(std::string_view code, std::string_view title);

// Split a directory name into code and slug; nullopt if it is not a course folder
std::optional<CourseDirectoryParts> parseCourseDirectory(std::string_view dir_name);

// Case-insensitive comparison of two course codes
bool sameCourseCode(std::string_view a, std::string_view b);

}  // namespace noter::core
