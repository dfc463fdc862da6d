#include "HeadingDetector.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace docstruct {

namespace {

constexpr double kDefaultFontSize = 12.0;

using NumberingSplit = std::optional<std::pair<std::string, std::string>>;

// Walks the numbering prefix of a heading candidate. The title after the
// prefix is taken as is, so long spans cost a single linear scan.
class PrefixCursor {
public:
    explicit PrefixCursor(const std::string& text)
        : text_(text) {}

    bool digits() {
        const std::size_t start = pos_;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9')
            ++pos_;
        return pos_ > start;
    }

    bool literal(char c) {
        if (pos_ >= text_.size() || text_[pos_] != c)
            return false;
        ++pos_;
        return true;
    }

    bool run(char c, std::size_t min_count, std::size_t max_count) {
        std::size_t n = 0;
        while (pos_ + n < text_.size() && text_[pos_ + n] == c)
            ++n;
        if (n < min_count || n > max_count)
            return false;
        pos_ += n;
        return true;
    }

    // Precomposed Hangul syllables are three bytes in UTF-8
    bool hangulSyllable() {
        const std::u32string cp = utf8ToUtf32(text_.substr(pos_, 3));
        if (cp.empty() || !isHangulSyllable(cp.front()))
            return false;
        pos_ += 3;
        return true;
    }

    std::size_t mark() const { return pos_; }

    // Mandatory whitespace, then a non-empty single-line title
    NumberingSplit finish(std::size_t number_begin, std::size_t number_end) const {
        const std::size_t title_begin = skipWhitespace(text_, pos_);
        if (title_begin == pos_ || title_begin >= text_.size())
            return std::nullopt;
        if (text_.find_first_of("\r\n", title_begin) != std::string::npos)
            return std::nullopt;
        return std::make_pair(text_.substr(number_begin, number_end - number_begin), text_.substr(title_begin));
    }

private:
    const std::string& text_;
    std::size_t pos_ = 0;
};

// "1. Title"
NumberingSplit matchDecimal(const std::string& text) {
    PrefixCursor cursor(text);
    if (!cursor.digits())
        return std::nullopt;
    const std::size_t number_end = cursor.mark();
    if (!cursor.literal('.'))
        return std::nullopt;
    return cursor.finish(0, number_end);
}

// "1.1 Title" (depth 2) and "1.1.1 Title" (depth 3); no trailing period
NumberingSplit matchDotted(const std::string& text, int depth) {
    PrefixCursor cursor(text);
    if (!cursor.digits())
        return std::nullopt;
    for (int i = 1; i < depth; ++i) {
        if (!cursor.literal('.') || !cursor.digits())
            return std::nullopt;
    }
    return cursor.finish(0, cursor.mark());
}

// "## Title", one to six hashes
NumberingSplit matchMarkup(const std::string& text) {
    PrefixCursor cursor(text);
    if (!cursor.run('#', 1, 6))
        return std::nullopt;
    return cursor.finish(0, cursor.mark());
}

// "가. Title"
NumberingSplit matchHangulOrdinal(const std::string& text) {
    PrefixCursor cursor(text);
    if (!cursor.hangulSyllable())
        return std::nullopt;
    const std::size_t number_end = cursor.mark();
    if (!cursor.literal('.'))
        return std::nullopt;
    return cursor.finish(0, number_end);
}

// "[1] Title"
NumberingSplit matchBracketed(const std::string& text) {
    PrefixCursor cursor(text);
    if (!cursor.literal('[') || !cursor.digits())
        return std::nullopt;
    const std::size_t number_end = cursor.mark();
    if (!cursor.literal(']'))
        return std::nullopt;
    return cursor.finish(1, number_end);
}

} // anonymous namespace

HeadingDetector::HeadingDetector(SegmenterOptions options)
    : options_(options) {
    initializeDefaultPatterns();
}

void HeadingDetector::registerPattern(NumberingStyle style, std::string example, NumberingMatcher matcher) {
    HeadingPatternDefinition def;
    def.style = style;
    def.example = std::move(example);
    def.matcher = std::move(matcher);
    definitions_.push_back(std::move(def));
}

void HeadingDetector::initializeDefaultPatterns() {
    // Order matters: the first matching style decides the level
    registerPattern(NumberingStyle::Decimal, "1. Title", matchDecimal);
    registerPattern(NumberingStyle::DecimalSub, "1.1 Title",
                    [](const std::string& text) { return matchDotted(text, 2); });
    registerPattern(NumberingStyle::DecimalSubSub, "1.1.1 Title",
                    [](const std::string& text) { return matchDotted(text, 3); });
    registerPattern(NumberingStyle::Markup, "## Title", matchMarkup);
    registerPattern(NumberingStyle::HangulOrdinal, "가. Title", matchHangulOrdinal);
    registerPattern(NumberingStyle::Bracketed, "[1] Title", matchBracketed);
}

int HeadingDetector::levelForNumbering(const std::string& number_part) {
    if (number_part.find('.') != std::string::npos)
        return static_cast<int>(std::count(number_part.begin(), number_part.end(), '.')) + 1;
    if (number_part.find('#') != std::string::npos)
        return static_cast<int>(number_part.size());
    return 1;
}

int HeadingDetector::levelForFontRatio(double ratio) {
    if (ratio >= 1.8)
        return 1;
    if (ratio >= 1.5)
        return 2;
    if (ratio >= 1.2)
        return 3;
    return 4;
}

double HeadingDetector::averageFontSize(const std::vector<Page>& pages) {
    double total = 0.0;
    std::size_t count = 0;
    for (const auto& page : pages) {
        for (const auto& span : page.spans) {
            if (span.font_size && *span.font_size > 0.0f) {
                total += *span.font_size;
                ++count;
            }
        }
    }
    return count == 0 ? kDefaultFontSize : total / static_cast<double>(count);
}

std::optional<HeadingMatch> HeadingDetector::matchPattern(const std::string& trimmed) const {
    for (const auto& def : definitions_) {
        auto parts = def.matcher(trimmed);
        if (!parts)
            continue;

        HeadingMatch match;
        match.title = trim(parts->second);
        match.level = levelForNumbering(parts->first);
        match.signal = HeadingSignal::Pattern;
        return match;
    }
    return std::nullopt;
}

std::optional<HeadingMatch> HeadingDetector::matchFontSize(const std::string& trimmed, std::optional<float> font_size,
                                                           double average_font_size) const {
    if (!font_size || *font_size <= 0.0f || average_font_size <= 0.0)
        return std::nullopt;

    const double size = *font_size;
    if (size < options_.min_heading_font_size)
        return std::nullopt;
    if (size < average_font_size * options_.font_size_ratio_threshold)
        return std::nullopt;

    HeadingMatch match;
    match.title = trimmed;
    match.level = levelForFontRatio(size / average_font_size);
    match.signal = HeadingSignal::FontSize;
    return match;
}

std::optional<HeadingMatch> HeadingDetector::detect(const TextSpan& span, double average_font_size) const {
    const std::string trimmed = trim(span.text);
    if (trimmed.empty())
        return std::nullopt;

    if (auto match = matchPattern(trimmed))
        return match;
    return matchFontSize(trimmed, span.font_size, average_font_size);
}

} // namespace docstruct
