#include "noter/util/slug.hpp"

#include <unicode/uchar.h>
#include <unicode/unorm2.h>
#include <unicode/ustring.h>
#include <unicode/utf16.h>

namespace noter::util {

namespace {

constexpr UChar32 kReplacementChar = 0xFFFD;

Result<std::u16string> toUtf16(std::string_view utf8) {
  if (utf8.empty()) {
    return std::u16string{};
  }

  UErrorCode status = U_ZERO_ERROR;
  int32_t length = 0;
  // Undecodable bytes become U+FFFD, which slugify treats as a separator
  u_strFromUTF8WithSub(nullptr, 0, &length, utf8.data(), static_cast<int32_t>(utf8.size()),
                       kReplacementChar, nullptr, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return makeErrorResult<std::u16string>(
        ErrorCode::kParseError, "Failed to calculate UTF-16 length: " + std::string(u_errorName(status)));
  }

  std::u16string result(static_cast<size_t>(length), u'\0');
  status = U_ZERO_ERROR;
  u_strFromUTF8WithSub(reinterpret_cast<UChar*>(result.data()), length, nullptr, utf8.data(),
                       static_cast<int32_t>(utf8.size()), kReplacementChar, nullptr, &status);
  if (U_FAILURE(status)) {
    return makeErrorResult<std::u16string>(
        ErrorCode::kParseError, "Failed to convert UTF-8 to UTF-16: " + std::string(u_errorName(status)));
  }
  return result;
}

Result<std::string> toUtf8(const std::u16string& utf16) {
  if (utf16.empty()) {
    return std::string{};
  }

  UErrorCode status = U_ZERO_ERROR;
  int32_t length = 0;
  const auto* source = reinterpret_cast<const UChar*>(utf16.data());
  u_strToUTF8(nullptr, 0, &length, source, static_cast<int32_t>(utf16.size()), &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return makeErrorResult<std::string>(
        ErrorCode::kParseError, "Failed to calculate UTF-8 length: " + std::string(u_errorName(status)));
  }

  std::string result(static_cast<size_t>(length), '\0');
  status = U_ZERO_ERROR;
  u_strToUTF8(result.data(), length, nullptr, source, static_cast<int32_t>(utf16.size()), &status);
  if (U_FAILURE(status)) {
    return makeErrorResult<std::string>(
        ErrorCode::kParseError, "Failed to convert UTF-16 to UTF-8: " + std::string(u_errorName(status)));
  }
  return result;
}

Result<std::u16string> normalizeNfc(const std::u16string& text) {
  if (text.empty()) {
    return text;
  }

  UErrorCode status = U_ZERO_ERROR;
  const UNormalizer2* normalizer = unorm2_getNFCInstance(&status);
  if (U_FAILURE(status)) {
    return makeErrorResult<std::u16string>(
        ErrorCode::kParseError, "Failed to initialize Unicode normalizer: " + std::string(u_errorName(status)));
  }

  const auto* source = reinterpret_cast<const UChar*>(text.data());
  const auto source_length = static_cast<int32_t>(text.size());
  int32_t length = unorm2_normalize(normalizer, source, source_length, nullptr, 0, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return makeErrorResult<std::u16string>(
        ErrorCode::kParseError, "Failed to calculate normalized length: " + std::string(u_errorName(status)));
  }

  std::u16string result(static_cast<size_t>(length), u'\0');
  status = U_ZERO_ERROR;
  unorm2_normalize(normalizer, source, source_length, reinterpret_cast<UChar*>(result.data()),
                   length, &status);
  if (U_FAILURE(status)) {
    return makeErrorResult<std::u16string>(
        ErrorCode::kParseError, "Failed to normalize text: " + std::string(u_errorName(status)));
  }
  return result;
}

void appendCodePoint(std::u16string& out, UChar32 c) {
  if (U_IS_BMP(c)) {
    out.push_back(static_cast<char16_t>(c));
  } else {
    out.push_back(static_cast<char16_t>(U16_LEAD(c)));
    out.push_back(static_cast<char16_t>(U16_TRAIL(c)));
  }
}

bool isContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

Result<std::string> slugify(std::string_view text) {
  auto utf16 = toUtf16(text);
  if (!utf16.has_value()) {
    return std::unexpected(utf16.error());
  }

  auto normalized = normalizeNfc(*utf16);
  if (!normalized.has_value()) {
    return std::unexpected(normalized.error());
  }

  const auto* source = reinterpret_cast<const UChar*>(normalized->data());
  const auto length = static_cast<int32_t>(normalized->size());

  std::u16string out;
  bool pending_separator = false;
  int32_t i = 0;
  while (i < length) {
    UChar32 c;
    U16_NEXT(source, i, length, c);

    const bool is_mark = (U_GET_GC_MASK(c) & U_GC_M_MASK) != 0;
    // A combining mark only counts as part of a word it directly follows
    const bool is_word = u_isalnum(c) || (is_mark && !out.empty() && !pending_separator);
    if (!is_word) {
      pending_separator = true;
      continue;
    }

    if (pending_separator && !out.empty()) {
      out.push_back(static_cast<char16_t>(kSlugSeparator));
    }
    pending_separator = false;
    appendCodePoint(out, u_tolower(c));
  }

  // Some letters only have a precomposed form in lower case ("T\u0308" -> "\u1E97")
  auto composed = normalizeNfc(out);
  if (!composed.has_value()) {
    return std::unexpected(composed.error());
  }

  auto slug = toUtf8(*composed);
  if (!slug.has_value()) {
    return slug;
  }

  if (slug->size() > kMaxSlugBytes) {
    size_t cut = kMaxSlugBytes;
    while (cut > 0 && isContinuationByte((*slug)[cut])) {
      --cut;
    }
    slug->resize(cut);
    while (!slug->empty() && slug->back() == kSlugSeparator) {
      slug->pop_back();
    }
  }

  return slug;
}

}  // namespace noter::util
