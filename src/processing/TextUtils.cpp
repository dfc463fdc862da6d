#include "TextUtils.hpp"
#include <utf8proc.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace docstruct
{

namespace
{

bool isAsciiSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // anonymous namespace

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            break;
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::string trim(std::string_view text)
{
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && isAsciiSpace(text[begin]))
        ++begin;
    while (end > begin && isAsciiSpace(text[end - 1]))
        --end;
    return std::string(text.substr(begin, end - begin));
}

bool isWhitespace(char32_t cp)
{
    if (cp < 0x80)
        return isAsciiSpace(static_cast<char>(cp));
    if (cp == 0x85)
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::size_t skipWhitespace(std::string_view text, std::size_t pos)
{
    const auto* bytes = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    while (pos < text.size())
    {
        utf8proc_int32_t cp;
        utf8proc_ssize_t step = utf8proc_iterate(bytes + pos, len - static_cast<utf8proc_ssize_t>(pos), &cp);
        if (step <= 0 || !isWhitespace(static_cast<char32_t>(cp)))
            break;
        pos += static_cast<std::size_t>(step);
    }
    return pos;
}

bool isBlank(std::string_view text)
{
    return std::all_of(text.begin(), text.end(), isAsciiSpace);
}

std::string caseFold(const std::string& text)
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* folded = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &folded,
                                        static_cast<utf8proc_option_t>(UTF8PROC_CASEFOLD | UTF8PROC_STABLE));
    if (len < 0 || !folded)
    {
        std::string lowered = text;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered;
    }

    std::string result(reinterpret_cast<char*>(folded), static_cast<std::size_t>(len));
    std::free(folded);
    return result;
}

bool isHangulSyllable(char32_t cp)
{
    return (cp >= U'\uAC00' && cp <= U'\uD7A3');
}

} // namespace docstruct
