#include "noter/core/note_name.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <set>

#include "noter/util/slug.hpp"

namespace noter::core {

namespace {

std::string withDate(const std::string& stem, const NamingOptions& options) {
  if (options.date_prefix.empty()) {
    return stem;
  }
  return options.date_prefix + util::kSlugSeparator + stem;
}

std::string untitledStem(const NamingOptions& options) {
  return withDate(options.untitled_prefix, options) + util::kSlugSeparator;
}

}  // namespace

Result<std::string> titledNoteFilename(std::string_view title, const NamingOptions& options) {
  auto slug = util::slugify(title);
  if (!slug.has_value()) {
    return std::unexpected(slug.error());
  }
  if (slug->empty()) {
    return makeErrorResult<std::string>(ErrorCode::kInvalidArgument,
                                        "Note title '" + std::string(title) +
                                        "' has no letters or digits to name a file after");
  }
  return withDate(*slug, options) + "." + options.extension;
}

std::string untitledNoteFilename(int index, const NamingOptions& options) {
  return untitledStem(options) + std::to_string(index) + "." + options.extension;
}

std::optional<int> parseUntitledIndex(std::string_view filename, const NamingOptions& options) {
  const std::string stem = untitledStem(options);
  const std::string suffix = "." + options.extension;
  if (filename.size() <= stem.size() + suffix.size() || !filename.starts_with(stem) ||
      !filename.ends_with(suffix)) {
    return std::nullopt;
  }

  auto digits = filename.substr(stem.size(), filename.size() - stem.size() - suffix.size());
  bool all_digits = std::all_of(digits.begin(), digits.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
  // "untitled-01" is a titled note that merely looks numbered
  if (!all_digits || (digits.size() > 1 && digits.front() == '0') || digits.size() > 9) {
    return std::nullopt;
  }

  int index = 0;
  for (char c : digits) {
    index = index * 10 + (c - '0');
  }
  return index;
}

std::string nextUntitledFilename(const std::vector<std::string>& existing,
                                 const NamingOptions& options) {
  std::set<int> taken;
  for (const auto& name : existing) {
    if (auto index = parseUntitledIndex(name, options)) {
      taken.insert(*index);
    }
  }

  int index = options.untitled_start;
  while (taken.count(index) > 0 && index < std::numeric_limits<int>::max()) {
    ++index;
  }
  return untitledNoteFilename(index, options);
}

}  // namespace noter::core
