#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "noter/common.hpp"

namespace noter::core {

// File naming rules for notes inside a course directory
struct NamingOptions {
  std::string extension = "md";
  std::string untitled_prefix = "untitled";
  int untitled_start = 1;
  std::string date_prefix;   // "YYYY-MM-DD" or empty
};

// "<date>-<slug>.<ext>" / "<slug>.<ext>"; kInvalidArgument if the title has no usable characters
Result<std::string> titledNoteFilename(std::string_view title, const NamingOptions& options);

// "<date>-untitled-<n>.<ext>" / "untitled-<n>.<ext>"
std::string untitledNoteFilename(int index, const NamingOptions& options);

// n if filename is an untitled note under these options
std::optional<int> parseUntitledIndex(std::string_view filename, const NamingOptions& options);

// Lowest-numbered untitled name (starting at untitled_start) absent from existing
std::string nextUntitledFilename(const std::vector<std::string>& existing,
                                 const NamingOptions& options);

}  // namespace noter::core
