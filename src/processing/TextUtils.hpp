#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docstruct
{

/// UTF-8 to UTF-32 conversion. Stops at the first invalid sequence.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Strip leading/trailing ASCII whitespace (space, \t, \n, \r, \f, \v)
std::string trim(std::string_view text);

/// ASCII whitespace plus Unicode space separators (Zs, Zl, Zp, U+0085)
bool isWhitespace(char32_t cp);

/// Byte offset of the first non-whitespace code point at or after pos
std::size_t skipWhitespace(std::string_view text, std::size_t pos);

/// True when the text is empty or whitespace only
bool isBlank(std::string_view text);

/// Unicode case folding (utf8proc). Falls back to ASCII lowering on invalid UTF-8.
std::string caseFold(const std::string& text);

/// Check if a codepoint is a precomposed Hangul syllable (U+AC00-U+D7A3)
bool isHangulSyllable(char32_t cp);

} // namespace docstruct
