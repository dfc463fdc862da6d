#include "UnicodeTextNormalizer.hpp"
#include "PreprocessorErrors.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <regex>
#include <utf8proc.h>
#include <plog/Log.h>

namespace docstruct
{

namespace
{

bool isHorizontalSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

std::string trimLine(const std::string& line)
{
    std::size_t begin = 0;
    std::size_t end = line.size();
    while (begin < end && isHorizontalSpace(line[begin]))
        ++begin;
    while (end > begin && isHorizontalSpace(line[end - 1]))
        --end;
    return line.substr(begin, end - begin);
}

// Letters and numbers of any script
bool isWordCategory(utf8proc_category_t category)
{
    switch (category)
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

bool isRemovableCategory(utf8proc_category_t category)
{
    switch (category)
    {
    case UTF8PROC_CATEGORY_CC:
    case UTF8PROC_CATEGORY_CF:
    case UTF8PROC_CATEGORY_CS:
    case UTF8PROC_CATEGORY_CO:
    case UTF8PROC_CATEGORY_CN:
        return true;
    default:
        return false;
    }
}

void appendCodepoint(std::string& out, utf8proc_int32_t cp)
{
    utf8proc_uint8_t buffer[4];
    utf8proc_ssize_t bytes = utf8proc_encode_char(cp, buffer);
    out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(bytes));
}

} // anonymous namespace

UnicodeTextNormalizer::UnicodeTextNormalizer(NormalizerOptions options)
    : options_(options)
{
}

UnicodeTextNormalizer::~UnicodeTextNormalizer() = default;

std::string UnicodeTextNormalizer::normalizeLineEndings(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::string UnicodeTextNormalizer::collapseNewlines(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string result;
    result.reserve(text.size());

    int consecutive_newlines = 0;
    for (char c : text)
    {
        if (c == '\n')
        {
            consecutive_newlines++;
            if (consecutive_newlines <= 2)
            {
                result += '\n';
            }
        }
        else
        {
            consecutive_newlines = 0;
            result += c;
        }
    }

    return result;
}

std::string UnicodeTextNormalizer::normalize(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string result = text;

    if (options_.normalize_unicode)
        result = composeUnicode(result);

    if (options_.remove_control_chars)
    {
        std::string stripped = removeControlCharacters(result);
        // Removing a code point can bring a base and a combining mark together
        if (options_.normalize_unicode && stripped.size() != result.size())
            stripped = composeUnicode(stripped);
        result = std::move(stripped);
    }

    if (options_.normalize_whitespace)
        result = normalizeWhitespace(result);

    return result;
}

std::vector<std::string> UnicodeTextNormalizer::normalizeBatch(const std::vector<std::string>& texts) const
{
    std::vector<std::string> out;
    out.reserve(texts.size());
    for (const auto& text : texts)
        out.push_back(normalize(text));
    return out;
}

std::string UnicodeTextNormalizer::composeUnicode(const std::string& text) const
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* composed = nullptr;
    utf8proc_ssize_t len = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                                        static_cast<utf8proc_ssize_t>(text.size()), &composed,
                                        static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE));
    if (len < 0 || !composed)
    {
        PLOG_WARNING << "NFC normalization failed: " << utf8proc_errmsg(len);
        throw NormalizationError(std::string("NFC normalization failed: ") + utf8proc_errmsg(len));
    }

    std::string nfc(reinterpret_cast<char*>(composed), static_cast<std::size_t>(len));
    std::free(composed);
    return nfc;
}

std::string UnicodeTextNormalizer::removeControlCharacters(const std::string& text) const
{
    std::string out;
    out.reserve(text.size());

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t cp;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &cp);
        if (bytes <= 0)
            throw NormalizationError("invalid UTF-8 at byte offset " + std::to_string(pos));
        pos += bytes;

        if (cp == '\t' || cp == '\n' || cp == '\r')
        {
            out.push_back(static_cast<char>(cp));
            continue;
        }
        if (isRemovableCategory(utf8proc_category(cp)))
            continue;
        appendCodepoint(out, cp);
    }
    return out;
}

std::string UnicodeTextNormalizer::normalizeWhitespace(const std::string& text) const
{
    const std::string unified = normalizeLineEndings(text);

    std::string joined;
    joined.reserve(unified.size());

    std::size_t start = 0;
    while (true)
    {
        std::size_t nl = unified.find('\n', start);
        std::string line = unified.substr(start, nl == std::string::npos ? std::string::npos : nl - start);

        std::string collapsed;
        collapsed.reserve(line.size());
        bool in_space = false;
        for (char c : line)
        {
            if (c == ' ' || c == '\t')
            {
                if (!in_space)
                    collapsed.push_back(' ');
                in_space = true;
            }
            else
            {
                collapsed.push_back(c);
                in_space = false;
            }
        }
        joined += trimLine(collapsed);

        if (nl == std::string::npos)
            break;
        joined.push_back('\n');
        start = nl + 1;
    }

    std::string result = collapseNewlines(joined);

    std::size_t first = result.find_first_not_of(" \t\n");
    if (first == std::string::npos)
        return std::string();
    std::size_t last = result.find_last_not_of(" \t\n");
    return result.substr(first, last - first + 1);
}

std::string UnicodeTextNormalizer::normalizeQuotes(const std::string& text) const
{
    static const std::regex single_quotes("\xE2\x80\x98|\xE2\x80\x99|`");
    static const std::regex double_quotes("\xE2\x80\x9C|\xE2\x80\x9D|\xE3\x80\x8C|\xE3\x80\x8D|\xE3\x80\x8E|\xE3\x80\x8F");

    std::string out = std::regex_replace(text, single_quotes, "'");
    return std::regex_replace(out, double_quotes, "\"");
}

std::string UnicodeTextNormalizer::normalizeNumbers(const std::string& text) const
{
    std::u32string wide = utf8ToUtf32(text);
    for (char32_t& cp : wide)
    {
        if (cp >= U'\uFF10' && cp <= U'\uFF19')
            cp = U'0' + (cp - U'\uFF10');
    }
    return utf32ToUtf8(wide);
}

std::string UnicodeTextNormalizer::removeExcessivePunctuation(const std::string& text) const
{
    static const std::regex repeated(R"(([.,!?;:]){3,})");
    return std::regex_replace(text, repeated, "$1$1");
}

std::string UnicodeTextNormalizer::removeUrls(const std::string& text) const
{
    static const std::regex url(R"(https?://\S+|www\.\S+)");
    return std::regex_replace(text, url, "");
}

std::string UnicodeTextNormalizer::cleanSpecialCharacters(const std::string& text, const std::string& keep_chars) const
{
    const std::u32string keep = utf8ToUtf32(keep_chars);
    std::u32string wide = utf8ToUtf32(text);

    auto is_special = [&keep](char32_t cp) {
        if (cp == U'_' || isWhitespace(cp) || keep.find(cp) != std::u32string::npos)
            return false;
        return !isWordCategory(utf8proc_category(static_cast<utf8proc_int32_t>(cp)));
    };
    wide.erase(std::remove_if(wide.begin(), wide.end(), is_special), wide.end());
    return utf32ToUtf8(wide);
}

} // namespace docstruct
