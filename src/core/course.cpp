#include "noter/core/course.hpp"

#include <algorithm>
#include <cctype>

#include "noter/util/slug.hpp"

namespace noter::core {

namespace {

bool isCodeChar(char c) {
  auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) != 0 || c == '_' || c == '.';
}

bool isValidCode(std::string_view code) {
  return !code.empty() && code.size() <= kMaxCourseCodeLength && code.front() != '.' &&
         std::all_of(code.begin(), code.end(), isCodeChar);
}

}  // namespace

Result<void> validateCourseCode(std::string_view code) {
  if (code.empty()) {
    return makeErrorResult<void>(ErrorCode::kInvalidArgument, "Course code must not be empty");
  }
  if (code.size() > kMaxCourseCodeLength) {
    return makeErrorResult<void>(ErrorCode::kInvalidArgument,
                                 "Course code is longer than " +
                                 std::to_string(kMaxCourseCodeLength) + " characters");
  }
  if (code.front() == '.') {
    return makeErrorResult<void>(ErrorCode::kInvalidArgument,
                                 "Course code must not start with '.'");
  }

  auto bad = std::find_if_not(code.begin(), code.end(), isCodeChar);
  if (bad != code.end()) {
    return makeErrorResult<void>(ErrorCode::kInvalidArgument,
                                 "Course code '" + std::string(code) +
                                 "' contains an invalid character '" + std::string(1, *bad) +
                                 "' (allowed: letters, digits, '_' and '.')");
  }
  return {};
}

Result<std::string> courseDirectoryName(std::string_view code, std::string_view title) {
  auto valid = validateCourseCode(code);
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto slug = util::slugify(title);
  if (!slug.has_value()) {
    return std::unexpected(slug.error());
  }

  std::string name(code);
  if (!slug->empty()) {
    name += util::kSlugSeparator;
    name += *slug;
  }
  return name;
}

std::optional<CourseDirectoryParts> parseCourseDirectory(std::string_view dir_name) {
  auto separator = dir_name.find(util::kSlugSeparator);
  std::string_view code = dir_name.substr(0, separator);
  if (!isValidCode(code)) {
    return std::nullopt;
  }

  CourseDirectoryParts parts;
  parts.code = std::string(code);
  if (separator != std::string_view::npos) {
    parts.slug = std::string(dir_name.substr(separator + 1));
  }
  return parts;
}

bool sameCourseCode(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace noter::core
