#pragma once

#include "../config/EngineConfig.hpp"
#include "../model/DocumentTypes.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docstruct
{

// Which signal recognized a heading
enum class HeadingSignal
{
    Pattern,  // Explicit numbering or markup
    FontSize  // Relative font size fallback
};

// Enumeration styles, in matching order
enum class NumberingStyle
{
    Decimal,        // "1. Title"
    DecimalSub,     // "1.1 Title"
    DecimalSubSub,  // "1.1.1 Title"
    Markup,         // "## Title"
    HangulOrdinal,  // "가. Title"
    Bracketed       // "[1] Title"
};

struct HeadingMatch
{
    std::string title;
    int level = 1;
    HeadingSignal signal = HeadingSignal::Pattern;
};

// Splits a trimmed span text into (numbering, title) when it has the style's shape
using NumberingMatcher = std::function<std::optional<std::pair<std::string, std::string>>(const std::string&)>;

struct HeadingPatternDefinition
{
    NumberingStyle style;
    std::string example;
    NumberingMatcher matcher;
};

// Heading pattern registry plus the font-size fallback
class HeadingDetector
{
public:
    explicit HeadingDetector(SegmenterOptions options = {});

    // Pattern signal first, then font size. Blank text is never a heading.
    [[nodiscard]] std::optional<HeadingMatch> detect(const TextSpan& span, double average_font_size) const;

    [[nodiscard]] std::optional<HeadingMatch> matchPattern(const std::string& trimmed) const;
    [[nodiscard]] std::optional<HeadingMatch> matchFontSize(const std::string& trimmed, std::optional<float> font_size,
                                                            double average_font_size) const;

    // "1.2.3" -> 3, "##" -> 2, anything else -> 1
    [[nodiscard]] static int levelForNumbering(const std::string& number_part);

    // >= 1.8 -> 1, >= 1.5 -> 2, >= 1.2 -> 3, else 4
    [[nodiscard]] static int levelForFontRatio(double ratio);

    // Mean of the positive font sizes in the document, 12.0 when there are none
    [[nodiscard]] static double averageFontSize(const std::vector<Page>& pages);

    [[nodiscard]] const std::vector<HeadingPatternDefinition>& patterns() const noexcept { return definitions_; }

private:
    void registerPattern(NumberingStyle style, std::string example, NumberingMatcher matcher);
    void initializeDefaultPatterns();

    SegmenterOptions options_;
    std::vector<HeadingPatternDefinition> definitions_;
};

} // namespace docstruct
