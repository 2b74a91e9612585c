#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "noter/common.hpp"

namespace noter::util {

/**
 * @brief Turn arbitrary human text into a filesystem-safe name segment
 *
 * The text is lower-cased and NFC-normalized. Letters, digits and combining
 * marks are kept; every run of anything else (whitespace, punctuation,
 * symbols, undecodable bytes) collapses into a single '-'. Leading and
 * trailing separators are dropped and the result is capped at
 * kMaxSlugBytes on a code point boundary.
 *
 * slugify(slugify(x)) == slugify(x) for every x. The result may be empty.
 *
 * @return Slug, or kParseError if ICU fails to process the text
 */
Result<std::string> slugify(std::string_view text);

inline constexpr char kSlugSeparator = '-';
inline constexpr size_t kMaxSlugBytes = 100;

}  // namespace noter::util
